#include "common/job.hpp"
#include "common/logger.hpp"
#include <chrono>
#include <random>
#include <sstream>

Job::Job(std::string id) : id_(std::move(id)) {}

bool Job::transition(State next) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(next) <= static_cast<int>(state_)) {
        Logger::warning("Job " + id_ + ": rejected transition " + stateToString(state_) +
                        " -> " + stateToString(next));
        return false;
    }
    Logger::debug("Job " + id_ + ": " + stateToString(state_) + " -> " + stateToString(next));
    state_ = next;
    return true;
}

void Job::finish(Outcome outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = State::DONE;
    outcome_ = outcome;
    status_ = outcomeToString(outcome);
}

void Job::updateProgress(int completed, int total) {
    ProgressCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        completed_ = completed;
        total_ = total;
        callback = progressCallback_;
    }
    if (callback) {
        callback(completed, total);
    }
}

void Job::setStatus(const std::string& status) {
    StatusCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        status_ = status;
        callback = statusCallback_;
    }
    if (callback) {
        callback(status);
    }
}

void Job::setError(const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_ = error;
}

std::string Job::getId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return id_;
}

Job::State Job::getState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

Job::Outcome Job::getOutcome() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outcome_;
}

int Job::getCompleted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_;
}

int Job::getTotal() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_;
}

std::string Job::getStatus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

std::string Job::getError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

std::string Job::generateId(const std::string& prefix) {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch());

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);
    const char* hex = "0123456789abcdef";

    std::stringstream ss;
    ss << prefix << "_" << seconds.count() << "_";
    for (int i = 0; i < 8; ++i) {
        ss << hex[dis(gen)];
    }
    return ss.str();
}

std::string Job::stateToString(State state) {
    switch (state) {
        case State::INIT:                 return "INIT";
        case State::VALIDATE_DESTINATION: return "VALIDATE_DESTINATION";
        case State::RETRIEVE:             return "RETRIEVE";
        case State::VERIFY:               return "VERIFY";
        case State::NOTIFY_START:         return "NOTIFY_START";
        case State::EXECUTE:              return "EXECUTE";
        case State::LOG:                  return "LOG";
        case State::NOTIFY_END:           return "NOTIFY_END";
        case State::DONE:                 return "DONE";
        default:                          return "UNKNOWN";
    }
}

std::string Job::outcomeToString(Outcome outcome) {
    switch (outcome) {
        case Outcome::NONE:      return "none";
        case Outcome::SUCCESS:   return "success";
        case Outcome::FAILURE:   return "failure";
        case Outcome::CANCELLED: return "cancelled";
        default:                 return "unknown";
    }
}
