#include <ludex/scan/library_scanner.hpp>

#include <ludex/catalog/platform.hpp>
#include <ludex/core/identity.hpp>

#include <ludex/util/dev_log.hpp>
#include <ludex/util/string_ops.hpp>
#include <ludex/util/thread_name.hpp>

#include <blockingconcurrentqueue.h>

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace ludex::scan {

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    // Hierarchy:
    //
    // base
    //   walk

    struct base {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Scanner";
    };

    struct walk : public base {
        static constexpr devlog::Level level = devlog::level::trace;
        static constexpr std::string_view name = "Scanner-Walk";
    };

} // namespace grp

struct ScanChannel {
    moodycamel::BlockingConcurrentQueue<ScanEvent> events;
};

// -------------------------------------------------------------------------------------------------
// Walker

namespace {

    bool IsHidden(const fs::path &path) {
        const std::string name = util::FileName(path);
        return !name.empty() && name.front() == '.';
    }

    // Returns the nested package rule whose marker is a subdirectory of `dir`, if any.
    const NestedPackageRule *FindContainerRule(const fs::path &dir) {
        for (const NestedPackageRule &rule : NestedPackageRules()) {
            std::error_code error{};
            if (fs::is_directory(dir / rule.marker, error)) {
                return &rule;
            }
        }
        return nullptr;
    }

    // Canonical absolute path if it resolves, absolute lexically normal path otherwise.
    fs::path ResolvePath(const fs::path &path) {
        std::error_code error{};
        fs::path resolved = fs::canonical(path, error);
        if (!error) {
            return resolved;
        }
        resolved = fs::absolute(path, error);
        return (error ? path : resolved).lexically_normal();
    }

    uint64 ComputeSize(const fs::path &path, bool isDirectory) {
        std::error_code error{};
        if (!isDirectory) {
            const auto size = fs::file_size(path, error);
            return error ? 0 : static_cast<uint64>(size);
        }

        uint64 total = 0;
        auto it = fs::recursive_directory_iterator(path, fs::directory_options::skip_permission_denied, error);
        for (auto end = fs::recursive_directory_iterator{}; !error && it != end; it.increment(error)) {
            std::error_code itemError{};
            if (it->is_regular_file(itemError)) {
                const auto size = it->file_size(itemError);
                if (!itemError) {
                    total += size;
                }
            }
        }
        return total;
    }

    class Walker {
    public:
        enum class Mode { Count, Collect };

        Walker(Mode mode, const ScanRequest &request, ScanResult &result,
               const std::function<void(const ScanProgress &)> &onProgress)
            : m_mode(mode)
            , m_request(request)
            , m_result(result)
            , m_onProgress(onProgress) {}

        // Walks one root. Returns false if the root cannot be opened.
        bool WalkRoot(const fs::path &root) {
            std::error_code error{};
            if (!fs::is_directory(root, error)) {
                return false;
            }
            fs::directory_iterator probe{root, error};
            if (error) {
                return false;
            }
            // Roots are neither counted nor treated as game folders
            VisitChildren(root);
            return true;
        }

        uint64 Visited() const {
            return m_visited;
        }

    private:
        Mode m_mode;
        const ScanRequest &m_request;
        ScanResult &m_result;
        const std::function<void(const ScanProgress &)> &m_onProgress;
        uint64 m_visited = 0;

        void Advance() {
            ++m_visited;
            if (m_mode == Mode::Collect) {
                m_result.progress.processed = m_visited;
                if (m_onProgress) {
                    m_onProgress(m_result.progress);
                }
            }
        }

        void VisitDirectory(const fs::path &dir) {
            Advance();

            if (const NestedPackageRule *rule = FindContainerRule(dir)) {
                if (m_mode == Mode::Collect) {
                    AddEntry(dir, Platform{rule->platform}, true);
                }
                return;
            }
            VisitChildren(dir);
        }

        void VisitChildren(const fs::path &dir) {
            std::vector<fs::path> dirs{};
            std::vector<fs::path> files{};
            std::error_code error{};
            for (fs::directory_iterator it{dir, fs::directory_options::skip_permission_denied, error}, end{};
                 !error && it != end; it.increment(error)) {
                const fs::path &path = it->path();
                if (IsHidden(path)) {
                    continue;
                }
                std::error_code typeError{};
                if (it->is_directory(typeError) && !it->is_symlink(typeError)) {
                    dirs.push_back(path);
                } else {
                    files.push_back(path);
                }
            }
            if (error) {
                devlog::debug<grp::walk>("Error listing {}: {}", util::PathString(dir), error.message());
            }

            auto byName = [](const fs::path &lhs, const fs::path &rhs) { return lhs.filename() < rhs.filename(); };
            std::sort(dirs.begin(), dirs.end(), byName);
            std::sort(files.begin(), files.end(), byName);

            for (const fs::path &subdir : dirs) {
                VisitDirectory(subdir);
            }
            for (const fs::path &file : files) {
                VisitFile(file);
            }
        }

        void VisitFile(const fs::path &file) {
            Advance();
            if (m_mode != Mode::Collect) {
                return;
            }

            std::error_code error{};
            if (!fs::is_regular_file(file, error)) {
                return;
            }
            if (auto platform = Classify(file)) {
                AddEntry(file, NormalizePlatform(*platform), false);
            }
        }

        void AddEntry(const fs::path &path, Platform platform, bool isDirectory) {
            Key key = ComputeKey(path);
            if (m_result.catalog.Contains(key)) {
                devlog::trace<grp::walk>("Duplicate {}", util::PathString(path));
                return;
            }

            CatalogEntry entry{
                .key = key,
                .title = CleanTitle(util::FileName(path)),
                .path = ResolvePath(path),
                .size = ComputeSize(path, isDirectory),
                .platform = std::move(platform),
                .metadata = {},
            };
            if (auto it = m_request.metadata.find(key); it != m_request.metadata.end()) {
                entry.metadata = it->second;
            }
            devlog::trace<grp::walk>("{} -> {} [{}]", util::PathString(path), entry.title, entry.platform);
            m_result.catalog.Add(std::move(entry));
        }
    };

    bool IsUnder(const fs::path &path, const fs::path &root) {
        auto rootIt = root.begin();
        auto pathIt = path.begin();
        for (; rootIt != root.end(); ++rootIt, ++pathIt) {
            if (rootIt->empty()) {
                // Trailing separator
                continue;
            }
            if (pathIt == path.end() || *pathIt != *rootIt) {
                return false;
            }
        }
        return true;
    }

} // namespace

// -------------------------------------------------------------------------------------------------
// ScanSession

ScanSession::ScanSession(std::shared_ptr<ScanChannel> channel)
    : m_channel(std::move(channel)) {}

bool ScanSession::Next(ScanEvent &event) {
    if (m_finished) {
        return false;
    }
    m_channel->events.wait_dequeue(event);
    if (event.type == ScanEvent::Type::Completed) {
        m_finished = true;
    }
    return true;
}

// -------------------------------------------------------------------------------------------------
// LibraryScanner

LibraryScanner::~LibraryScanner() {
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

std::unique_ptr<ScanSession> LibraryScanner::Scan(ScanRequest request) {
    State expected = State::Idle;
    if (!m_state.compare_exchange_strong(expected, State::Scanning, std::memory_order_acq_rel)) {
        devlog::info<grp::base>("Scan already in progress; request ignored");
        return nullptr;
    }

    // The previous worker has already published its result; reap it
    if (m_thread.joinable()) {
        m_thread.join();
    }

    auto channel = std::make_shared<ScanChannel>();
    m_thread = std::thread([this, channel, request = std::move(request)] {
        util::SetCurrentThreadName("Scanner thread");

        ScanResult result = Walk(request, [&](const ScanProgress &progress) {
            if (request.observer) {
                request.observer(progress);
            }
            channel->events.enqueue(ScanEvent{.type = ScanEvent::Type::Progress, .value = progress});
        });

        m_state.store(State::Idle, std::memory_order_release);
        channel->events.enqueue(ScanEvent{.type = ScanEvent::Type::Completed, .value = std::move(result)});
    });

    return std::make_unique<ScanSession>(std::move(channel));
}

ScanResult LibraryScanner::Walk(const ScanRequest &request,
                                const std::function<void(const ScanProgress &)> &onProgress) {
    ScanResult result{};

    devlog::info<grp::base>("Scanning {} roots", request.roots.size());

    // Pre-pass: count everything the walk will visit
    {
        ScanResult scratch{};
        Walker counter{Walker::Mode::Count, request, scratch, onProgress};
        for (const fs::path &root : request.roots) {
            counter.WalkRoot(root);
        }
        result.progress.total = counter.Visited();
    }

    Walker walker{Walker::Mode::Collect, request, result, onProgress};
    for (const fs::path &root : request.roots) {
        if (!walker.WalkRoot(root)) {
            devlog::warn<grp::base>("Skipping unreadable root {}", util::PathString(root));
            result.unreadableRoots.push_back(root);
        }
    }

    devlog::info<grp::base>("Scan complete: {} entries in {} platforms, {} of {} items visited", result.catalog.Size(),
                            result.catalog.Platforms().size(), result.progress.processed, result.progress.total);
    return result;
}

size_t CarryOverUnreadableRoots(const Catalog &previous, ScanResult &result) {
    if (result.unreadableRoots.empty()) {
        return 0;
    }

    std::vector<fs::path> roots{};
    for (const fs::path &root : result.unreadableRoots) {
        roots.push_back(ResolvePath(root));
    }

    size_t carried = 0;
    for (const auto &[key, entry] : previous.Entries()) {
        const bool underUnreadable =
            std::any_of(roots.begin(), roots.end(), [&](const fs::path &root) { return IsUnder(entry.path, root); });
        if (underUnreadable && result.catalog.Add(entry)) {
            ++carried;
        }
    }
    if (carried > 0) {
        devlog::info<grp::base>("Kept {} entries from unreadable roots", carried);
    }
    return carried;
}

} // namespace ludex::scan
