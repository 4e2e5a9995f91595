#pragma once

#include <algorithm>
#include <solranklib/concurrent/bounded_queue.hh>
#include <thread>
#include <vector>

namespace concurrent {

// Processes jobs produced by produce_jobs() using a fixed number of workers.
// process_job() must not throw.
template <class Job>
class JobProcessor {
    unsigned workers_no_;
    BoundedQueue<Job> jobs_;

    void worker() {
        for (;;) {
            auto job = jobs_.pop_opt();
            if (not job.has_value()) {
                return;
            }

            process_job(std::move(*job));
        }
    }

    void generate_jobs_and_signal_no_more() {
        produce_jobs();
        jobs_.signal_no_more_elems();
    }

protected:
    void add_job(Job job) { jobs_.push(std::move(job)); }

    virtual void process_job(Job job) noexcept = 0;

    virtual void produce_jobs() = 0;

public:
    // @p workers_no is the number of jobs processed at the same time (at least 1)
    explicit JobProcessor(unsigned workers_no)
    : workers_no_(std::max(workers_no, 1U))
    , jobs_(workers_no_ * 2) {}

    void run() {
        // The current thread only produces jobs
        std::vector<std::thread> workers(workers_no_);
        for (std::thread& thr : workers) {
            thr = std::thread([&] { worker(); });
        }
        try {
            generate_jobs_and_signal_no_more();
        } catch (...) {
            jobs_.signal_no_more_elems();
            for (std::thread& thr : workers) {
                thr.join();
            }
            throw;
        }
        for (std::thread& thr : workers) {
            thr.join();
        }
    }

    JobProcessor(const JobProcessor&) = delete;
    JobProcessor(JobProcessor&&) noexcept = delete;
    JobProcessor& operator=(const JobProcessor&) = delete;
    JobProcessor& operator=(JobProcessor&&) noexcept = delete;

    virtual ~JobProcessor() = default;
};

} // namespace concurrent
