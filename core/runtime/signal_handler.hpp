#pragma once

#include <atomic>

namespace coderun
{
    namespace runtime
    {

        class SignalHandler
        {
        public:
            // SIGINT/SIGTERM request shutdown; SIGPIPE is ignored
            static void install();
            static bool is_shutdown_requested();

            // Tests only
            static void reset();

        private:
            static void handle_signal(int signal);
            static std::atomic<bool> shutdown_requested_;
        };

    } // namespace runtime
} // namespace coderun
