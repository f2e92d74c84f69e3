#include "transfer_engine.hpp"
#include <exception>
#include <stdexcept>
#include <vector>
#include <fmt/format.h>

namespace {

std::string formatLength(std::optional<std::uint64_t> length) {
    return length ? fmt::format("{} bytes", *length) : std::string("unknown length");
}

bool validFileName(const std::string& name) {
    return !name.empty() && name != "." && name != ".." && name.find('/') == std::string::npos;
}

} // namespace

TransferEngine::TransferEngine(std::unique_ptr<TransferBackend> backend, EngineOptions options, const Logger& logger)
    : backend_(std::move(backend)), options_(options), logger_(logger), resolver_(logger) {
    if (!backend_) {
        throw std::invalid_argument("Transfer engine requires a backend");
    }
    if (options_.chunkSize == 0) {
        throw std::invalid_argument("Transfer chunk size must be positive");
    }
}

TransferResult TransferEngine::upload(const TransferRequest& request) {
    TransferResult result;
    result.fileName = request.destination.fileName;
    result.directory = normalizeDirectory(request.destination.directory);
    result.startTime = std::chrono::system_clock::now();

    std::expected<void, TransferError> outcome;
    try {
        outcome = run(request, result);
    } catch (const std::exception& e) {
        outcome = std::unexpected(TransferError{ErrorKind::IOError, e.what()});
    } catch (...) {
        outcome = std::unexpected(TransferError{ErrorKind::IOError, "Unknown error raised during transfer"});
    }

    if (!outcome) {
        result.success = false;
        result.endTime = std::chrono::system_clock::now();
        result.error = outcome.error();
        logger_.logError(fmt::format("Error uploading file {} to {}: {}", request.destination.fileName,
                                     result.directory.empty() ? "/" : result.directory, describe(outcome.error())));
    }
    return result;
}

std::expected<void, TransferError> TransferEngine::run(const TransferRequest& request, TransferResult& result) {
    const std::string& desiredName = request.destination.fileName;
    if (!validFileName(desiredName)) {
        return std::unexpected(TransferError{ErrorKind::InvalidArgument, fmt::format("Invalid file name: '{}'", desiredName)});
    }

    if (auto connected = backend_->connect(); !connected) {
        return std::unexpected(TransferError{ErrorKind::ConnectionFailure, connected.error().message});
    }

    ByteSource& source = request.source;
    const auto total = source.length();
    bool directoryReady = false;

    for (int attempt = 1; attempt <= kMaxCreateAttempts; ++attempt) {
        std::string finalName = desiredName;
        if (request.policy == CollisionPolicy::Rename) {
            auto resolved = resolver_.resolve(*backend_, result.directory, desiredName);
            if (!resolved) {
                return std::unexpected(resolved.error());
            }
            finalName = std::move(*resolved);
        }
        result.fileName = finalName;

        if (!directoryReady) {
            if (auto directory = backend_->ensureDirectory(result.directory); !directory) {
                return std::unexpected(directory.error());
            }
            directoryReady = true;
        }

        const std::string path = joinPath(result.directory, finalName);
        auto plan = planWrite(path, source, request.policy);
        if (!plan && plan.error().kind == ErrorKind::AlreadyExists && attempt < kMaxCreateAttempts) {
            logger_.logWarning(fmt::format("{}; resolving a new name", plan.error().message));
            continue;
        }
        if (!plan) {
            return std::unexpected(plan.error());
        }

        const std::uint64_t offset = plan->mode.offset;
        ProgressReporter reporter(request.progress, total, offset, logger_);

        if (plan->skip) {
            result.success = true;
            result.skipped = true;
            result.bytesTransferred = *total;
            result.resumeOffset = *total;
            result.endTime = std::chrono::system_clock::now();
            logger_.logMessage(fmt::format("File {} already exists with same or larger size, skipping", path));
            reporter.finish(*total, true);
            return {};
        }

        result.resumeOffset = offset;
        result.bytesTransferred = offset;
        logger_.logDebug(fmt::format("Uploading {} ({}) to {} backend from byte {}", path, formatLength(total), backend_->name(), offset));

        std::expected<std::uint64_t, TransferError> written;
        if (backend_->hasNativeUpload()) {
            written = uploadNative(source, path, plan->mode, reporter, request.cancel);
        } else {
            InlineProgressMeter meter(reporter, offset, options_.reportInterval);
            auto copied = copyInline(source, path, plan->mode, meter, request.cancel);
            result.bytesTransferred = meter.transferred();
            if (copied) {
                written = meter.transferred() - offset;
            } else {
                written = std::unexpected(copied.error());
            }
        }

        if (!written) {
            const TransferError& error = written.error();
            if (error.kind == ErrorKind::AlreadyExists && request.policy == CollisionPolicy::Rename && attempt < kMaxCreateAttempts) {
                logger_.logWarning(fmt::format("Lost the race for {}; resolving a new name", path));
                continue;
            }
            if (error.kind == ErrorKind::Cancelled && backend_->hasNativeUpload()) {
                if (auto landed = backend_->size(path); landed && landed->has_value()) {
                    result.bytesTransferred = **landed;
                }
            }
            return std::unexpected(error);
        }

        // Storage can silently truncate, so the write call's own status is not trusted.
        auto verified = backend_->size(path);
        if (!verified) {
            return std::unexpected(verified.error());
        }
        const std::uint64_t expectedSize = total.value_or(offset + *written);
        const std::uint64_t actualSize = verified->value_or(0);
        if (!verified->has_value() || actualSize != expectedSize) {
            result.bytesTransferred = actualSize;
            reporter.finish(actualSize, false);
            return std::unexpected(TransferError{ErrorKind::SizeMismatch,
                                                 fmt::format("Size mismatch: expected {}, got {}", expectedSize, actualSize)});
        }

        result.success = true;
        result.bytesTransferred = expectedSize;
        result.endTime = std::chrono::system_clock::now();
        logger_.logMessage(fmt::format("Successfully uploaded {} ({} bytes) in {}ms at {:.2f} KB/s", path, expectedSize,
                                       result.duration().count(), result.throughput() / 1024));
        reporter.finish(expectedSize, true);
        return {};
    }

    return std::unexpected(TransferError{ErrorKind::AlreadyExists,
                                         fmt::format("Could not claim a free name for {} after {} attempts", desiredName, kMaxCreateAttempts)});
}

std::expected<TransferEngine::WritePlan, TransferError> TransferEngine::planWrite(const std::string& path, ByteSource& source,
                                                                                  CollisionPolicy policy) {
    auto existing = backend_->size(path);
    if (!existing) {
        return std::unexpected(existing.error());
    }
    if (!existing->has_value()) {
        const bool exclusive = policy == CollisionPolicy::Rename && backend_->supportsExclusiveCreate();
        return WritePlan{exclusive ? WriteMode::createExclusive() : WriteMode::createOrTruncate()};
    }
    if (policy == CollisionPolicy::Rename) {
        return std::unexpected(TransferError{ErrorKind::AlreadyExists, fmt::format("{} appeared after name resolution", path)});
    }

    const std::uint64_t existingSize = **existing;
    const auto total = source.length();
    if (!total) {
        logger_.logWarning(fmt::format("Source length unknown, cannot resume {}. Starting fresh upload.", path));
        return WritePlan{WriteMode::createOrTruncate()};
    }
    if (existingSize >= *total) {
        return WritePlan{WriteMode::createOrTruncate(), true};
    }
    if (existingSize == 0) {
        return WritePlan{WriteMode::createOrTruncate()};
    }
    if (!source.seekable()) {
        logger_.logWarning(fmt::format("Stream is not seekable, cannot resume {}. Starting fresh upload.", path));
        return WritePlan{WriteMode::createOrTruncate()};
    }
    if (!backend_->supportsResume()) {
        logger_.logWarning(fmt::format("The {} backend cannot resume {}. Starting fresh upload.", backend_->name(), path));
        return WritePlan{WriteMode::createOrTruncate()};
    }

    if (auto seeked = source.seek(existingSize); !seeked) {
        return std::unexpected(seeked.error());
    }
    logger_.logMessage(fmt::format("Resuming upload of {} from byte {} of {}", path, existingSize, *total));
    return WritePlan{WriteMode::resumeAt(existingSize)};
}

std::expected<void, TransferError> TransferEngine::copyInline(ByteSource& source, const std::string& path, WriteMode mode,
                                                              InlineProgressMeter& meter, std::stop_token cancel) {
    auto opened = backend_->openForWrite(path, mode);
    if (!opened) {
        return std::unexpected(opened.error());
    }
    std::unique_ptr<WriteSink> sink = std::move(*opened);

    std::vector<char> buffer(options_.chunkSize);
    while (true) {
        if (cancel.stop_requested()) {
            if (auto closed = sink->close(); !closed) {
                logger_.logWarning(fmt::format("Failed to close partial file {}: {}", path, describe(closed.error())));
            }
            return std::unexpected(TransferError{ErrorKind::Cancelled, "Upload cancelled by user"});
        }

        auto count = source.read(buffer);
        if (!count) {
            return std::unexpected(count.error());
        }
        if (*count == 0) {
            break;
        }

        auto written = writeChunk(sink, path, std::span<const char>(buffer.data(), *count), meter.transferred());
        if (!written) {
            return std::unexpected(written.error());
        }
        meter.advance(*count);
    }
    return sink->close();
}

std::expected<void, TransferError> TransferEngine::writeChunk(std::unique_ptr<WriteSink>& sink, const std::string& path,
                                                              std::span<const char> chunk, std::uint64_t chunkStart) {
    std::span<const char> remaining = chunk;
    for (int attempt = 0;; ++attempt) {
        auto written = sink->write(remaining);
        if (written) {
            return {};
        }

        const TransferError& error = written.error();
        if (error.kind != ErrorKind::TransientIOError || !backend_->supportsResume()) {
            return std::unexpected(error);
        }
        if (attempt >= options_.retryAttempts) {
            return std::unexpected(TransferError{ErrorKind::TransientIOError,
                                                 fmt::format("{} (gave up after {} retries)", error.message, attempt)});
        }
        logger_.logWarning(fmt::format("Transient write error on {}: {}. Retrying ({}/{})", path, error.message, attempt + 1,
                                       options_.retryAttempts));

        sink.reset();
        auto current = backend_->size(path);
        if (!current) {
            return std::unexpected(current.error());
        }
        const std::uint64_t landed = current->value_or(0);
        if (landed < chunkStart || landed > chunkStart + chunk.size()) {
            return std::unexpected(TransferError{ErrorKind::IOError,
                                                 fmt::format("Destination {} holds {} bytes, expected between {} and {}", path, landed,
                                                             chunkStart, chunkStart + chunk.size())});
        }
        remaining = chunk.subspan(static_cast<std::size_t>(landed - chunkStart));

        auto reopened = backend_->openForWrite(path, WriteMode::resumeAt(landed));
        if (!reopened) {
            return std::unexpected(reopened.error());
        }
        sink = std::move(*reopened);
    }
}

std::expected<std::uint64_t, TransferError> TransferEngine::uploadNative(ByteSource& source, const std::string& path, WriteMode mode,
                                                                         ProgressReporter& reporter, std::stop_token cancel) {
    PollingProgressMonitor monitor(reporter, [backend = backend_, path] { return backend->sampleSize(path); },
                                   source.length(), options_.pollInterval, cancel, logger_);
    monitor.start();

    auto sent = backend_->upload(source, path, mode, cancel);

    if (!monitor.stop(options_.monitorStopTimeout)) {
        logger_.logWarning(fmt::format("Progress monitor for {} did not stop within {}ms", path, options_.monitorStopTimeout.count()));
    }
    return sent;
}
