#pragma once

#include <string>
#include <functional>
#include <mutex>

// Callback type definitions
using ProgressCallback = std::function<void(int completed, int total)>;
using StatusCallback = std::function<void(const std::string& status)>;

// Lifecycle of one backup or restore invocation. States only move forward;
// optional ones (RETRIEVE, VERIFY, NOTIFY_START, NOTIFY_END) may be skipped.
class Job {
public:
    enum class State {
        INIT,
        VALIDATE_DESTINATION,
        RETRIEVE,
        VERIFY,
        NOTIFY_START,
        EXECUTE,
        LOG,
        NOTIFY_END,
        DONE
    };

    enum class Outcome {
        NONE,
        SUCCESS,
        FAILURE,
        CANCELLED
    };

    explicit Job(std::string id);

    bool transition(State next);
    // Moves to DONE and records the terminal outcome
    void finish(Outcome outcome);

    void updateProgress(int completed, int total);
    void setStatus(const std::string& status);
    void setError(const std::string& error);

    std::string getId() const;
    State getState() const;
    Outcome getOutcome() const;
    int getCompleted() const;
    int getTotal() const;
    std::string getStatus() const;
    std::string getError() const;
    bool isDone() const { return getState() == State::DONE; }

    void setProgressCallback(ProgressCallback callback) { progressCallback_ = std::move(callback); }
    void setStatusCallback(StatusCallback callback) { statusCallback_ = std::move(callback); }

    // "{prefix}_{unix seconds}_{8 hex chars}"
    static std::string generateId(const std::string& prefix);
    static std::string stateToString(State state);
    static std::string outcomeToString(Outcome outcome);

private:
    std::string id_;
    State state_{State::INIT};
    Outcome outcome_{Outcome::NONE};
    std::string status_{"init"};
    int completed_{0};
    int total_{0};
    std::string error_;
    ProgressCallback progressCallback_;
    StatusCallback statusCallback_;
    mutable std::mutex mutex_;
};
