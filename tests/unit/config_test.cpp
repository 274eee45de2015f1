#include <atomic>
#include <cassert>
#include <thread>
#include "core/config.hpp"
#include "core/logging.hpp"

int main() {
    core::OutputFormat f = core::OutputFormat::Text;
    assert(core::parse_output_format("json", f) && f == core::OutputFormat::Json);
    assert(core::parse_output_format("text", f) && f == core::OutputFormat::Text);
    assert(!core::parse_output_format("xml", f) && f == core::OutputFormat::Text);

    core::Config c = core::get_config();
    c.verbose = true;
    c.threads = 3;
    c.output = core::OutputFormat::Json;
    core::set_config(c);
    assert(core::get_config().threads == 3);
    assert(core::get_config().output == core::OutputFormat::Json);
    assert(core::is_verbose());

    c.verbose = false;
    core::set_config(c);
    assert(!core::is_verbose());
    // Readers get whole snapshots while another thread rewrites the options
    {
        std::atomic<bool> stop{false};
        std::thread writer([&]() {
            core::Config a = c, b = c;
            a.threads = 1;
            a.output = core::OutputFormat::Text;
            b.threads = 2;
            b.output = core::OutputFormat::Json;
            for (int i = 0; !stop; ++i) core::set_config(i % 2 ? a : b);
        });
        for (int i = 0; i < 20000; ++i) {
            const core::Config snap = core::get_config();
            assert((snap.threads == 1 && snap.output == core::OutputFormat::Text) ||
                   (snap.threads == 2 && snap.output == core::OutputFormat::Json) ||
                   (snap.threads == 3 && snap.output == core::OutputFormat::Json));
        }
        stop = true;
        writer.join();
    }
    c.threads = 3;
    core::set_config(c);
    assert(core::get_config().threads == 3);

    core::log_debug("suppressed");
    core::log_info("config test done");
    return 0;
}
