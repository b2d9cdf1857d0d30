#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace ncpfm {

// A backend primitive failed (HTTP status, or 0 for local IO / transport errors)
class StorageError : public std::runtime_error {
public:
    StorageError(const std::string& message, int status_code = 0)
        : std::runtime_error(message), status_code_(status_code) {}

    int status_code() const { return status_code_; }
    bool not_found() const { return status_code_ == 404; }

private:
    int status_code_;
};

// Single-blob download gave up after exhausting its retry budget
class DownloadFailed : public std::runtime_error {
public:
    DownloadFailed(std::string blob, std::string destination, int attempts, std::string cause)
        : std::runtime_error("Failed to download " + blob + " to " + destination +
                             " after " + std::to_string(attempts) + " attempts: " + cause),
          blob_(std::move(blob)),
          destination_(std::move(destination)),
          attempts_(attempts),
          cause_(std::move(cause)) {}

    const std::string& blob() const { return blob_; }
    const std::string& destination() const { return destination_; }
    int attempts() const { return attempts_; }
    const std::string& cause() const { return cause_; }

private:
    std::string blob_;
    std::string destination_;
    int attempts_;
    std::string cause_;
};

class UploadFailed : public std::runtime_error {
public:
    UploadFailed(std::string blob, std::string cause)
        : std::runtime_error("Error uploading " + blob + ": " + cause),
          blob_(std::move(blob)),
          cause_(std::move(cause)) {}

    const std::string& blob() const { return blob_; }
    const std::string& cause() const { return cause_; }

private:
    std::string blob_;
    std::string cause_;
};

// Raised by bulk operations once every submitted task has returned.
// first_failed_name() is the first failure observed in completion order;
// completed() holds what succeeded (local paths for downloads, blob names
// otherwise) and failure_count() counts every failed task.
class BatchTransferFailed : public std::runtime_error {
public:
    BatchTransferFailed(std::string first_failed_name, std::string cause,
                        std::vector<std::string> completed, size_t failure_count)
        : std::runtime_error("Batch transfer failed on " + first_failed_name + ": " + cause +
                             " (" + std::to_string(failure_count) + " failed, " +
                             std::to_string(completed.size()) + " completed)"),
          first_failed_name_(std::move(first_failed_name)),
          cause_(std::move(cause)),
          completed_(std::move(completed)),
          failure_count_(failure_count) {}

    const std::string& first_failed_name() const { return first_failed_name_; }
    const std::string& cause() const { return cause_; }
    const std::vector<std::string>& completed() const { return completed_; }
    size_t failure_count() const { return failure_count_; }

private:
    std::string first_failed_name_;
    std::string cause_;
    std::vector<std::string> completed_;
    size_t failure_count_;
};

class InvalidConfiguration : public std::runtime_error {
public:
    explicit InvalidConfiguration(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace ncpfm
