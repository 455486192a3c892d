#pragma once

#include <stop_token>
#include <thread>

namespace fixcap_rt::threading
{
    // CRTP worker: Derived provides Init(), Run() and Shutdown(). Run() is
    // called repeatedly on the worker thread until Stop() is requested.
    template <typename Derived>
    class Thread
    {
    public:
        Thread() = default;

        void Spawn()
        {
            if (thread_.joinable())
                return;

            thread_ = std::jthread([this](std::stop_token token)
                                   { threadFcn_(token); });
        }

        void Stop()
        {
            if (!thread_.joinable())
                return;
            thread_.request_stop();
            thread_.join();
        }

        bool IsRunning() const { return thread_.joinable(); }

        // Derived classes must call Stop() in their own destructor
        ~Thread() = default;

    protected:
        std::stop_token get_stop_token() const { return thread_.get_stop_token(); }

    private:
        std::jthread thread_;

        void init_() { static_cast<Derived *>(this)->Init(); }

        void run_() { static_cast<Derived *>(this)->Run(); }

        void shutdown_() { static_cast<Derived *>(this)->Shutdown(); }

        void threadFcn_(std::stop_token stop_token)
        {
            init_();

            while (!stop_token.stop_requested())
            {
                run_();
            }

            shutdown_();
        }
    };
} // namespace fixcap_rt::threading
