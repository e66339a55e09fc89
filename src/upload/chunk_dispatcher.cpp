/**
 * @file chunk_dispatcher.cpp
 * @brief Bounded-concurrency chunk dispatch implementation
 */

#include "kcenon/chunked_upload/upload/chunk_dispatcher.h"

#include "kcenon/chunked_upload/core/content_address.h"
#include "kcenon/chunked_upload/core/logging.h"
#include "kcenon/chunked_upload/upload/admission_gate.h"
#include "kcenon/chunked_upload/upload/result_aggregator.h"

#include <exception>
#include <future>
#include <mutex>
#include <optional>
#include <vector>

namespace kcenon::chunked_upload {

namespace {

/**
 * @brief State shared by the dispatch loop and its tasks for one run
 */
struct dispatch_run {
    result_aggregator aggregator;
    std::mutex mutex;
    dispatch_stats stats;
    upload_progress progress;
};

auto exception_result(uint64_t index, const char* what) -> chunk_result {
    chunk_result r;
    r.index = index;
    r.failure = error{error_code::internal_error,
        "chunk " + std::to_string(index) + ": unhandled exception: " + what};
    return r;
}

}  // namespace

chunk_dispatcher::chunk_dispatcher(dispatch_config config,
                                   std::shared_ptr<adapters::upload_worker_pool> pool,
                                   std::shared_ptr<cancellation_token> token)
    : config_(std::move(config)), pool_(std::move(pool)), token_(std::move(token)) {
    if (config_.max_in_flight == 0) {
        config_.max_in_flight = 1;
    }
    if (!pool_) {
        pool_ = adapters::worker_pool_factory::create(config_.max_in_flight);
    }
    if (!token_) {
        token_ = std::make_shared<cancellation_token>();
    }
}

auto chunk_dispatcher::on_progress(progress_callback callback) -> chunk_dispatcher& {
    progress_ = std::move(callback);
    return *this;
}

auto chunk_dispatcher::config() const -> const dispatch_config& {
    return config_;
}

auto chunk_dispatcher::dispatch(chunk_reader& reader, const chunk_handler& handler)
    -> result<dispatch_outcome> {
    auto gate = std::make_shared<admission_gate>(config_.max_in_flight);
    std::weak_ptr<admission_gate> weak_gate = gate;
    token_->on_cancel([weak_gate]() {
        if (auto g = weak_gate.lock()) {
            g->interrupt();
        }
    });

    dispatch_run run;
    run.progress.planned_chunks = reader.plan().data_chunk_count();
    run.progress.file_size = reader.plan().file_size;

    CU_LOG_DEBUG(log_category::dispatcher,
                 "Dispatching " + std::to_string(run.progress.planned_chunks) +
                     " chunks with at most " + std::to_string(config_.max_in_flight) +
                     " in flight");

    std::vector<std::future<void>> futures;
    uint64_t enumerated = 0;

    while (reader.has_next()) {
        if (token_->is_cancelled()) {
            break;
        }

        auto slot = gate->acquire();
        if (!slot) {
            break;
        }

        auto next = reader.next();
        if (!next) {
            run.aggregator.fail(error{next.error().code,
                "chunk " + std::to_string(reader.current_index()) + " " +
                to_string(chunk_operation::read) + ": " + next.error().message});
            token_->cancel();
            break;
        }
        ++enumerated;

        auto held = std::make_shared<admission_gate::permit>(std::move(slot.value()));
        auto index = next.value().index;
        auto length = next.value().size();

        auto task = [this, &run, &handler, held, index, length,
                     piece = std::move(next.value())]() mutable {
            chunk_result outcome;
            try {
                outcome = handler(std::move(piece));
            } catch (const std::exception& e) {
                outcome = exception_result(index, e.what());
            } catch (...) {
                outcome = exception_result(index, "unknown exception");
            }

            if (outcome.succeeded()) {
                try {
                    std::lock_guard<std::mutex> lock(run.mutex);
                    if (outcome.uploaded) {
                        ++run.stats.chunks_uploaded;
                        run.stats.bytes_uploaded += length;
                    } else {
                        ++run.stats.chunks_deduplicated;
                    }
                    run.stats.bytes_processed += length;

                    ++run.progress.completed_chunks;
                    run.progress.bytes_processed += length;
                    run.progress.last_index = index;
                    run.progress.deduplicated = !outcome.uploaded;
                    if (progress_) {
                        progress_(run.progress);
                    }
                } catch (const std::exception& e) {
                    outcome = exception_result(index, e.what());
                } catch (...) {
                    outcome = exception_result(index, "unknown exception");
                }
            }

            bool failed = !outcome.succeeded();
            held->release();
            run.aggregator.submit(std::move(outcome));
            if (failed) {
                token_->cancel();
            }
        };

        try {
            futures.push_back(pool_->submit_to_stage(std::move(task), config_.stage_name));
        } catch (const std::exception& e) {
            held->release();
            --enumerated;
            run.aggregator.fail(error{error_code::internal_error,
                "chunk " + std::to_string(index) + ": could not schedule task: " + e.what()});
            token_->cancel();
            break;
        }
    }

    if (token_->is_cancelled() && !run.aggregator.has_failed()) {
        run.aggregator.fail(error{error_code::operation_cancelled, "upload cancelled"});
    }

    run.aggregator.seal(enumerated);
    auto collected = run.aggregator.collect();

    // Tasks reference the run state, so every one must finish first.
    std::optional<error> task_error;
    for (auto& f : futures) {
        try {
            f.get();
        } catch (const std::exception& e) {
            CU_LOG_ERROR(log_category::dispatcher,
                         std::string("Chunk task terminated abnormally: ") + e.what());
            if (!task_error) {
                task_error = error{error_code::internal_error, e.what()};
            }
        } catch (...) {
            CU_LOG_ERROR(log_category::dispatcher, "Chunk task terminated abnormally");
            if (!task_error) {
                task_error = error{error_code::internal_error, "unknown exception"};
            }
        }
    }

    if (!collected) {
        return unexpected{collected.error()};
    }
    if (task_error) {
        return unexpected{*task_error};
    }

    dispatch_outcome outcome;
    outcome.manifest = std::move(collected.value());
    outcome.stats = run.stats;
    outcome.stats.chunks_enumerated = enumerated;
    outcome.stats.peak_in_flight = gate->peak_in_use();

    CU_LOG_INFO(log_category::dispatcher,
                "Processed " + std::to_string(enumerated) + " chunks (" +
                    std::to_string(outcome.stats.chunks_uploaded) + " uploaded, " +
                    std::to_string(outcome.stats.chunks_deduplicated) + " already stored)");
    return outcome;
}

auto chunk_dispatcher::make_session_handler(const upload_session& session,
                                            std::string file_name) -> chunk_handler {
    return [&session, file_name = std::move(file_name)](chunk piece) -> chunk_result {
        auto id = content_addresser::compute(piece.bytes());
        if (!id) {
            return chunk_result::failed(piece.index, chunk_operation::hash, id.error());
        }

        auto exists = session.probe(id.value());
        if (!exists) {
            return chunk_result::failed(piece.index, chunk_operation::probe, exists.error());
        }

        upload_log_context ctx;
        ctx.session_id = session.session_id();
        ctx.chunk_index = piece.index;
        ctx.part_number = piece.part_number();

        if (exists.value()) {
            CU_LOG_DEBUG_CTX(log_category::dispatcher, "Chunk already stored, skipping upload",
                             ctx);
            return chunk_result::success(piece.index, id.value(), false);
        }

        auto sent = session.upload(id.value(), piece.bytes(), piece.part_number(), file_name);
        if (!sent) {
            return chunk_result::failed(piece.index, chunk_operation::upload, sent.error());
        }

        CU_LOG_DEBUG_CTX(log_category::dispatcher, "Chunk uploaded", ctx);
        return chunk_result::success(piece.index, id.value(), true);
    };
}

}  // namespace kcenon::chunked_upload
