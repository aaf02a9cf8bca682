// Shared helpers for the framework-less test executables (run via CTest).
#pragma once

#include "batchdl/cancellation.hpp"
#include "batchdl/destination_sink.hpp"
#include "batchdl/errors.hpp"
#include "batchdl/progress.hpp"
#include "batchdl/remote_source.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace batchdl::test {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const std::string &haystack, const std::string &needle,
                       const std::string &msg) {
        check(haystack.find(needle) != std::string::npos, msg);
    }

    int finish(const char *suite) const {
        if (failures != 0) {
            std::cerr << "[FAILURES] " << failures << "\n";
            return EXIT_FAILURE;
        }
        std::cout << "[OK] " << suite << "\n";
        return EXIT_SUCCESS;
    }
};

inline std::string makePayload(std::size_t size, char seed = 'a') {
    std::string data(size, '\0');
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<char>(seed + static_cast<char>(i % 26));
    }
    return data;
}

struct FakeResource {
    std::string data;
    bool advertise_size = true;
    // Overrides the advertised size when set.
    std::optional<std::uint64_t> size_hint;
    // Delay before every read; honors cancellation.
    std::chrono::milliseconds read_delay{0};
};

// In-memory RemoteSource. Unknown addresses fail like an HTTP 404.
class FakeSource final : public RemoteSource {
public:
    void add(const std::string &address, FakeResource resource) {
        std::lock_guard<std::mutex> lock(mutex_);
        resources_[address] = std::move(resource);
    }

    RemoteStream open(const std::string &address, const CancellationToken &token) override {
        token.throwIfCancellationRequested();

        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = resources_.find(address);
        if (it == resources_.end()) {
            throw TransportError("HTTP 404 for " + address);
        }
        ++opened_;
        ++open_now_;
        max_open_ = std::max(max_open_, open_now_);

        RemoteStream remote;
        remote.stream = std::make_unique<Stream>(*this, it->second);
        if (it->second.size_hint) {
            remote.size_hint = it->second.size_hint;
        } else if (it->second.advertise_size) {
            remote.size_hint = it->second.data.size();
        }
        return remote;
    }

    int opened() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return opened_;
    }
    int closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }
    int maxOpen() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return max_open_;
    }

private:
    class Stream final : public ByteStream {
    public:
        Stream(FakeSource &owner, FakeResource resource)
            : owner_(owner), resource_(std::move(resource)) {}

        ~Stream() override {
            std::lock_guard<std::mutex> lock(owner_.mutex_);
            --owner_.open_now_;
            ++owner_.closed_;
        }

        std::size_t read(char *buffer, std::size_t size, const CancellationToken &token) override {
            if (resource_.read_delay.count() > 0 && !token.waitFor(resource_.read_delay)) {
                throw OperationCanceled();
            }
            const std::size_t count = std::min(size, resource_.data.size() - offset_);
            std::memcpy(buffer, resource_.data.data() + offset_, count);
            offset_ += count;
            return count;
        }

    private:
        FakeSource &owner_;
        FakeResource resource_;
        std::size_t offset_ = 0;
    };

    mutable std::mutex mutex_;
    std::map<std::string, FakeResource> resources_;
    int opened_ = 0;
    int closed_ = 0;
    int open_now_ = 0;
    int max_open_ = 0;
};

class MemoryDestination final : public DestinationSink {
public:
    void failOpen(const std::string &identifier) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_open_.insert(identifier);
    }

    std::unique_ptr<WritableStream> openForWrite(const std::string &identifier) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_open_.count(identifier) != 0) {
            throw SinkError("Permission denied: " + identifier);
        }
        files_[identifier].clear();
        return std::make_unique<Writer>(*this, identifier);
    }

    std::string contents(const std::string &identifier) const {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = files_.find(identifier);
        return it == files_.end() ? std::string{} : it->second;
    }

    bool has(const std::string &identifier) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return files_.count(identifier) != 0;
    }

private:
    class Writer final : public WritableStream {
    public:
        Writer(MemoryDestination &owner, std::string identifier)
            : owner_(owner), identifier_(std::move(identifier)) {}

        void write(const char *data, std::size_t size) override {
            std::lock_guard<std::mutex> lock(owner_.mutex_);
            owner_.files_[identifier_].append(data, size);
        }

    private:
        MemoryDestination &owner_;
        std::string identifier_;
    };

    mutable std::mutex mutex_;
    std::map<std::string, std::string> files_;
    std::set<std::string> fail_open_;
};

// Records every event in arrival order. The hook runs outside the lock.
class RecordingSink final : public ProgressSink {
public:
    using Hook = std::function<void(const ProgressEvent &)>;

    RecordingSink() = default;
    explicit RecordingSink(Hook hook) : hook_(std::move(hook)) {}

    void onProgress(const ProgressEvent &event) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(event);
        }
        if (hook_) {
            hook_(event);
        }
    }

    std::vector<ProgressEvent> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    std::vector<ProgressEvent> eventsFor(const std::string &name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<ProgressEvent> out;
        for (const auto &event : events_) {
            if (event.name == name) {
                out.push_back(event);
            }
        }
        return out;
    }

private:
    Hook hook_;
    mutable std::mutex mutex_;
    std::vector<ProgressEvent> events_;
};

// Checks the per-task event protocol and returns the terminal status, or
// nothing when the sequence is malformed.
inline std::optional<DownloadStatus> checkLifecycle(TestContext &t,
                                                    const std::vector<ProgressEvent> &events,
                                                    const std::string &name) {
    t.check(!events.empty(), name + ": should emit at least one event");
    if (events.empty()) {
        return std::nullopt;
    }

    bool ok = true;
    std::optional<std::uint64_t> total;
    for (std::size_t i = 0; i < events.size(); ++i) {
        const auto &event = events[i];
        const bool last = i + 1 == events.size();
        if (last != isTerminal(event.status)) {
            ok = false;
            t.check(false, name + ": exactly the last event must be terminal");
        }
        if (event.status == DownloadStatus::Starting && i != 0) {
            ok = false;
            t.check(false, name + ": Starting must come first");
        }
        if (event.status == DownloadStatus::Downloading && (i == 0 || events[0].status != DownloadStatus::Starting)) {
            ok = false;
            t.check(false, name + ": Downloading must follow Starting");
        }
        if (i > 0 && event.bytes_transferred < events[i - 1].bytes_transferred) {
            ok = false;
            t.check(false, name + ": bytes_transferred must not decrease");
        }
        if (total && event.total_bytes != total) {
            ok = false;
            t.check(false, name + ": total_bytes must not change once set");
        }
        if (event.total_bytes) {
            total = event.total_bytes;
        }
        if (event.error_detail.has_value() != (event.status == DownloadStatus::Failed)) {
            ok = false;
            t.check(false, name + ": error_detail must be present exactly on Failed");
        }
    }
    if (!ok) {
        return std::nullopt;
    }
    return events.back().status;
}

} // namespace batchdl::test
