#pragma once

#include <string>

// Cooperative cancellation keyed by job id, polled between accounts.
class CancellationCheck {
public:
    virtual ~CancellationCheck() = default;

    virtual bool isCancelled(const std::string& jobId) const = 0;
    // Called once the request has been acted on
    virtual void clear(const std::string& jobId) = 0;
};

// Marker files {cancelDir}/{jobId}.cancel written by whoever wants the job stopped.
class FileCancellationStore : public CancellationCheck {
public:
    explicit FileCancellationStore(std::string cancelDir);

    bool requestCancel(const std::string& jobId);
    bool isCancelled(const std::string& jobId) const override;
    void clear(const std::string& jobId) override;

    std::string markerPath(const std::string& jobId) const;
    std::string getLastError() const { return lastError_; }

private:
    std::string cancelDir_;
    std::string lastError_;
};

class NeverCancelled : public CancellationCheck {
public:
    bool isCancelled(const std::string&) const override { return false; }
    void clear(const std::string&) override {}
};
