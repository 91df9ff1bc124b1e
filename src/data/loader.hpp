#ifndef STRATA_DATA_LOADER_HPP
#define STRATA_DATA_LOADER_HPP
/*
 * Batch sources for the training loop.
 * ---------------------------------------------------------------------------
 *  - `Source` is what the trainer consumes: a fixed number of full batches
 *    per pass (the remainder is dropped), each [N, C, H, W] in [0, 1].
 *  - `PrefetchLoader` decodes and augments images in a pool of worker
 *    threads that fill a bounded queue. Each worker owns a generator seeded
 *    from (seed, worker index), so no two workers share a random stream.
 *    Worker w builds batches w, w + W, w + 2W, ... of every pass, so the
 *    same seed and worker count reproduce the same batches. They are
 *    delivered in completion order.
 *  - A worker failure is captured and rethrown from `next()` on the
 *    consuming thread.
 *  - `TensorSource` serves an in-memory tensor, used by tests and small runs.
 */

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <mutex>
#include <numeric>
#include <queue>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "load/load.hpp"

namespace Strata::Data {

    class Source {
    public:
        virtual ~Source() = default;
        [[nodiscard]] virtual std::int64_t batches_per_epoch() const = 0;
        // Starts a new pass: reshuffles and rewinds.
        virtual void reset() = 0;
        virtual torch::Tensor next() = 0;
    };

    namespace Details {
        [[nodiscard]] inline std::uint64_t splitmix64(std::uint64_t value) noexcept
        {
            value += 0x9E3779B97F4A7C15ULL;
            value = (value ^ (value >> 30)) * 0xBF58476D1CE4E5B9ULL;
            value = (value ^ (value >> 27)) * 0x94D049BB133111EBULL;
            return value ^ (value >> 31);
        }

        class BatchQueue {
        public:
            explicit BatchQueue(std::size_t max_size) : max_size_(std::max<std::size_t>(max_size, 1)) {}

            // Blocks while full. Returns false once the queue is closed.
            bool push(torch::Tensor batch)
            {
                std::unique_lock<std::mutex> lock(mutex_);
                not_full_.wait(lock, [this] { return queue_.size() < max_size_ || done_; });
                if (done_) {
                    return false;
                }
                queue_.push(std::move(batch));
                not_empty_.notify_one();
                return true;
            }

            // Blocks while empty. Returns false once closed and drained.
            bool pop(torch::Tensor& batch)
            {
                std::unique_lock<std::mutex> lock(mutex_);
                not_empty_.wait(lock, [this] { return !queue_.empty() || done_; });
                if (queue_.empty()) {
                    return false;
                }
                batch = std::move(queue_.front());
                queue_.pop();
                not_full_.notify_one();
                return true;
            }

            void set_done()
            {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    done_ = true;
                }
                not_empty_.notify_all();
                not_full_.notify_all();
            }

            void reset()
            {
                std::lock_guard<std::mutex> lock(mutex_);
                while (!queue_.empty()) {
                    queue_.pop();
                }
                done_ = false;
            }

        private:
            std::size_t max_size_;
            std::mutex mutex_;
            std::condition_variable not_empty_;
            std::condition_variable not_full_;
            std::queue<torch::Tensor> queue_;
            bool done_{false};
        };
    }

    [[nodiscard]] inline std::uint64_t seed_for_worker(std::uint64_t base_seed, std::size_t worker_index) noexcept
    {
        return Details::splitmix64(base_seed ^ Details::splitmix64(static_cast<std::uint64_t>(worker_index) + 1));
    }

    struct PrefetchOptions {
        std::int64_t batch_size{16};
        std::size_t workers{8};   // 0: batches are built synchronously inside next()
        std::size_t prefetch{2};  // queued batches per worker
        std::uint64_t seed{0};
    };

    class PrefetchLoader final : public Source {
    public:
        PrefetchLoader(Load::ImageDataset dataset, PrefetchOptions options)
            : dataset_(std::move(dataset)),
              options_(options),
              shuffle_rng_(Details::splitmix64(options.seed)),
              queue_(std::max<std::size_t>(options.workers * options.prefetch, 1) + 1)
        {
            if (options_.batch_size <= 0) {
                throw std::invalid_argument("PrefetchLoader batch size must be positive.");
            }
            total_batches_ = static_cast<std::int64_t>(dataset_.size()) / options_.batch_size;
            if (total_batches_ == 0) {
                throw std::invalid_argument("Dataset of " + std::to_string(dataset_.size())
                                            + " images cannot fill a single batch of " + std::to_string(options_.batch_size) + ".");
            }
            indices_.resize(dataset_.size());
            std::iota(indices_.begin(), indices_.end(), std::size_t{0});

            const auto generators = std::max<std::size_t>(options_.workers, 1);
            generators_.reserve(generators);
            for (std::size_t i = 0; i < generators; ++i) {
                generators_.emplace_back(seed_for_worker(options_.seed, i));
            }
        }

        ~PrefetchLoader() override { stop_workers(); }

        PrefetchLoader(const PrefetchLoader&) = delete;
        PrefetchLoader& operator=(const PrefetchLoader&) = delete;

        [[nodiscard]] std::int64_t batches_per_epoch() const override { return total_batches_; }

        void reset() override
        {
            stop_workers();
            queue_.reset();
            consumed_ = 0;
            pushed_ = 0;
            {
                std::lock_guard<std::mutex> lock(error_mutex_);
                error_ = nullptr;
            }
            std::shuffle(indices_.begin(), indices_.end(), shuffle_rng_);

            if (options_.workers > 0) {
                running_ = true;
                workers_.reserve(options_.workers);
                for (std::size_t i = 0; i < options_.workers; ++i) {
                    workers_.emplace_back(&PrefetchLoader::worker_loop, this, i);
                }
            }
            started_ = true;
        }

        torch::Tensor next() override
        {
            if (!started_) {
                reset();
            }
            if (consumed_ >= total_batches_) {
                throw std::out_of_range("PrefetchLoader pass exhausted after " + std::to_string(total_batches_)
                                        + " batches; call reset() to start another.");
            }

            if (options_.workers == 0) {
                auto batch = build_batch(consumed_, generators_.front());
                ++consumed_;
                return batch;
            }

            torch::Tensor batch;
            if (!queue_.pop(batch)) {
                rethrow_worker_error();
                throw std::runtime_error("PrefetchLoader workers stopped before the pass was complete.");
            }
            ++consumed_;
            return batch;
        }

        [[nodiscard]] const Load::ImageDataset& dataset() const noexcept { return dataset_; }

    private:
        void worker_loop(std::size_t worker_index)
        {
            auto& rng = generators_[worker_index];
            const auto stride = static_cast<std::int64_t>(options_.workers);
            try {
                for (auto batch_index = static_cast<std::int64_t>(worker_index);
                     batch_index < total_batches_ && running_.load();
                     batch_index += stride) {
                    auto batch = build_batch(batch_index, rng);
                    if (!running_.load() || !queue_.push(std::move(batch))) {
                        break;
                    }
                    if (pushed_.fetch_add(1) + 1 == total_batches_) {
                        queue_.set_done();
                    }
                }
            } catch (...) {
                {
                    std::lock_guard<std::mutex> lock(error_mutex_);
                    if (!error_) {
                        error_ = std::current_exception();
                    }
                }
                queue_.set_done();
            }
        }

        torch::Tensor build_batch(std::int64_t batch_index, Transform::Augmentation::Generator& rng) const
        {
            std::vector<torch::Tensor> samples;
            samples.reserve(static_cast<std::size_t>(options_.batch_size));
            const auto start = static_cast<std::size_t>(batch_index * options_.batch_size);
            for (std::int64_t i = 0; i < options_.batch_size; ++i) {
                samples.push_back(dataset_.get(indices_[start + static_cast<std::size_t>(i)], rng));
            }
            return torch::stack(samples);
        }

        void rethrow_worker_error()
        {
            std::exception_ptr error;
            {
                std::lock_guard<std::mutex> lock(error_mutex_);
                error = error_;
            }
            if (error) {
                std::rethrow_exception(error);
            }
        }

        void stop_workers()
        {
            running_ = false;
            queue_.set_done();
            for (auto& worker : workers_) {
                if (worker.joinable()) {
                    worker.join();
                }
            }
            workers_.clear();
        }

        Load::ImageDataset dataset_;
        PrefetchOptions options_;
        std::int64_t total_batches_{0};
        std::int64_t consumed_{0};
        bool started_{false};

        std::vector<std::size_t> indices_{};
        std::vector<Transform::Augmentation::Generator> generators_{};
        std::mt19937_64 shuffle_rng_;

        Details::BatchQueue queue_;
        std::vector<std::thread> workers_{};
        std::atomic<bool> running_{false};
        std::atomic<std::int64_t> pushed_{0};

        std::mutex error_mutex_;
        std::exception_ptr error_{};
    };

    class TensorSource final : public Source {
    public:
        TensorSource(torch::Tensor samples, std::int64_t batch_size, bool shuffle = true, std::uint64_t seed = 0)
            : samples_(std::move(samples)), batch_size_(batch_size), shuffle_(shuffle), rng_(Details::splitmix64(seed))
        {
            if (!samples_.defined() || samples_.dim() != 4) {
                throw std::invalid_argument("TensorSource expects an [N, C, H, W] tensor.");
            }
            if (batch_size_ <= 0 || samples_.size(0) < batch_size_) {
                throw std::invalid_argument("TensorSource cannot fill a single batch of " + std::to_string(batch_size_)
                                            + " from " + std::to_string(samples_.size(0)) + " samples.");
            }
            order_ = torch::arange(samples_.size(0), torch::kLong);
        }

        [[nodiscard]] std::int64_t batches_per_epoch() const override { return samples_.size(0) / batch_size_; }

        void reset() override
        {
            cursor_ = 0;
            if (shuffle_) {
                std::vector<std::int64_t> order(static_cast<std::size_t>(samples_.size(0)));
                std::iota(order.begin(), order.end(), std::int64_t{0});
                std::shuffle(order.begin(), order.end(), rng_);
                order_ = torch::tensor(order, torch::kLong);
            }
        }

        torch::Tensor next() override
        {
            if (cursor_ >= batches_per_epoch()) {
                throw std::out_of_range("TensorSource pass exhausted; call reset() to start another.");
            }
            auto indices = order_.narrow(0, cursor_ * batch_size_, batch_size_);
            ++cursor_;
            return samples_.index_select(0, indices.to(samples_.device()));
        }

    private:
        torch::Tensor samples_;
        std::int64_t batch_size_;
        bool shuffle_;
        std::mt19937_64 rng_;
        torch::Tensor order_{};
        std::int64_t cursor_{0};
    };
}

#endif // STRATA_DATA_LOADER_HPP
