/*
    Sandgate - sandbox egress gateway with TLS inspection and credential injection.
    Copyright (c) 2014, Ales Stibal <astib@mag0.net>, All rights reserved.

    Sandgate is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    Sandgate is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with Sandgate.  If not, see <http://www.gnu.org/licenses/>.

    Linking Sandgate statically or dynamically with other modules is
    making a combined work based on Sandgate. Thus, the terms and
    conditions of the GNU General Public License cover the whole combination.

    In addition, as a special exception, the copyright holders of Sandgate
    give you permission to combine Sandgate with free software programs
    or libraries that are released under the GNU LGPL and with code
    included in the standard release of OpenSSL under the OpenSSL's license
    (or modified versions of such code, with unchanged license).
    You may copy and distribute such a system following the terms
    of the GNU GPL for Sandgate and the licenses of the other code
    concerned, provided that you include the source code of that other code
    when and as the GNU GPL requires distribution of source code.

    Note that people who make modified versions of Sandgate are not
    obligated to grant this special exception for their modified versions;
    it is their choice whether to do so. The GNU General Public License
    gives permission to release a modified version without this exception;
    this exception also makes it possible to release a modified version
    which carries forward this exception.
*/

#ifndef SANDGATE_UTILS_TPOOL_HPP
#define SANDGATE_UTILS_TPOOL_HPP

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include <pthread.h>

#include <display.hpp>

namespace sg {

    /*
     * Small pool for short blocking jobs (file reads) which callers wait for with a timeout.
     * Tasks get the stop flag and should check it in their loops:
       ```cpp
            pool.enqueue([path, result](std::atomic_bool const& stop_flag) {
                if(stop_flag) return;
                result->set_value(read(path));
            });
       ```
     */
    class ThreadPool {
    private:
        using callable = std::function<void(std::atomic_bool const&)>;

        std::vector<std::thread> workers_;
        std::queue<callable> tasks_;
        mutable std::mutex lock_;
        std::condition_variable cv_;
        std::atomic_bool stop_ {false};

        std::atomic_uint active_ {0};

        struct stats_t {
            std::atomic_uint std_except {0};
            std::atomic_uint unk_except {0};
        };
        stats_t stats_;

    public:
        stats_t const& stats() const { return stats_; }

        ThreadPool(std::size_t threads, std::string const& name) {

            for (std::size_t i = 0; i < threads; ++i) {
                workers_.emplace_back([this] {
                    while (true) {
                        callable task;
                        {
                            auto lc_ = std::unique_lock(lock_);
                            cv_.wait(lc_, [this] {
                                return stop_ || !tasks_.empty();
                            });

                            // pending tasks are dropped on stop
                            if (stop_) return;

                            task = std::move(tasks_.front());
                            tasks_.pop();
                        }

                        active_++;
                        try {
                            task(stop_);
                        }
                        catch(std::exception const&) {
                            stats_.std_except++;
                        }
                        catch(...) {
                            stats_.unk_except++;
                        }
                        active_--;
                    }
                });

                pthread_setname_np(workers_.back().native_handle(), string_format("%s_%d", name.c_str(), i).c_str());
            }
        }

        ThreadPool(ThreadPool const&) = delete;
        ThreadPool& operator=(ThreadPool const&) = delete;

        std::size_t worker_count() const {
            auto lc_ = std::unique_lock(lock_);
            return workers_.size();
        }

        std::size_t tasks_size() const {
            auto lc_ = std::unique_lock(lock_);
            return tasks_.size();
        }

        std::size_t tasks_running() const {
            return active_;
        }

        [[nodiscard]] bool is_stopping() const { return stop_; }

        // false if the pool is stopping and the task was not queued
        template<class F>
        bool enqueue(F&& f) {
            {
                auto lc_ = std::unique_lock(lock_);
                if (stop_) {
                    return false;
                }
                tasks_.emplace(std::forward<F>(f));
            }
            cv_.notify_one();
            return true;
        }

        ~ThreadPool() {
            {
                auto lc_ = std::unique_lock(lock_);
                stop_ = true;
            }

            cv_.notify_all();
            for (std::thread& worker : workers_) {
                if(worker.joinable())
                    worker.join();
            }
        }
    };
}

#endif
