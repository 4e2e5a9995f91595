#include <algorithm>
#include <gtest/gtest.h>
#include <solranklib/concurrent/job_processor.hh>
#include <solranklib/concurrent/mutexed_value.hh>
#include <stdexcept>
#include <vector>

namespace {

class SquareProcessor : public concurrent::JobProcessor<int> {
    int jobs_no_;
    bool throw_in_producer_;

public:
    concurrent::MutexedValue<std::vector<int>> results;

    SquareProcessor(unsigned workers_no, int jobs_no, bool throw_in_producer = false)
    : JobProcessor(workers_no)
    , jobs_no_(jobs_no)
    , throw_in_producer_(throw_in_producer) {}

protected:
    void produce_jobs() override {
        for (int i = 0; i < jobs_no_; ++i) {
            if (throw_in_producer_ and i == jobs_no_ / 2) {
                throw std::runtime_error("producer failure");
            }
            add_job(i);
        }
    }

    void process_job(int job) noexcept override {
        results.perform([&](auto& res) { res.emplace_back(job * job); });
    }
};

} // namespace

// NOLINTNEXTLINE
TEST(JobProcessor, processes_all_jobs) {
    for (unsigned workers_no : {0U, 1U, 4U}) {
        SquareProcessor proc(workers_no, 100);
        proc.run();
        auto results = proc.results.perform([](auto& res) { return res; });
        ASSERT_EQ(results.size(), 100U) << workers_no;
        std::sort(results.begin(), results.end());
        for (int i = 0; i < 100; ++i) {
            EXPECT_EQ(results[i], i * i);
        }
    }
}

// NOLINTNEXTLINE
TEST(JobProcessor, producer_exception_is_propagated) {
    SquareProcessor proc(3, 10, true);
    EXPECT_THROW(proc.run(), std::runtime_error);
    EXPECT_EQ(proc.results.perform([](auto& res) { return res.size(); }), 5U);
}
