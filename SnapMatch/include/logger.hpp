#pragma once

#include <atomic>
#include <charconv>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

#define SNAPMATCH_TRACE(...) ::snapmatch::logger::trace(__VA_ARGS__)
#define SNAPMATCH_DEBUG(...) ::snapmatch::logger::debug(__VA_ARGS__)
#define SNAPMATCH_INFO(...) ::snapmatch::logger::info(__VA_ARGS__)
#define SNAPMATCH_WARN(...) ::snapmatch::logger::warn(__VA_ARGS__)
#define SNAPMATCH_ERROR(...) ::snapmatch::logger::error(__VA_ARGS__)

/**
 * -------------
 * USAGE OVERVIEW
 * -------------
 *
 * // Initialize once, specifying log level and ring size (power-of-two):
 * snapmatch::logger::init(snapmatch::logger::Level::INFO, 4096);
 *
 * // Log from any worker thread with:
 * SNAPMATCH_WARN("catalog", "skipping ", path, ": ", reason);
 *
 * // On shutdown (drains pending messages):
 * snapmatch::logger::shutdown();
 *
 * Messages logged before init() or after shutdown() are dropped.
*/

namespace snapmatch::logger
{
    enum Level : uint8_t
    {
        TRACE = 0,
        DEBUG,
        INFO,
        WARN,
        ERROR_L
    };

    constexpr const char* levelToStr(Level lv) noexcept
    {
        switch (lv)
        {
        case TRACE: return "TRACE";
        case DEBUG: return "DEBUG";
        case INFO:  return "INFO";
        case WARN:  return "WARN";
        case ERROR_L: return "ERROR";
        }
        return "UNKNOWN";
    }

    // CLI verbosity: 1=trace, 2=debug, 3=info, 4=warnings and errors
    constexpr Level levelFromVerbosity(int verbosity) noexcept
    {
        switch (verbosity)
        {
        case 1: return TRACE;
        case 2: return DEBUG;
        case 3: return INFO;
        default: return WARN;
        }
    }

    namespace detail
    {
        inline void appendOne(std::string& dest, const char* str)
        {
            if (str) {
                dest += str;
            }
        }

        inline void appendOne(std::string& dest, const std::string& s)
        {
            dest += s;
        }

        inline void appendOne(std::string& dest, bool b)
        {
            dest += b ? "true" : "false";
        }

        template <typename T,
            typename std::enable_if_t<std::is_arithmetic_v<T> && !std::is_same_v<T, bool>, int> = 0>
        inline void appendOne(std::string& dest, T val)
        {
            char buf[64];
            auto end = std::to_chars(buf, buf + sizeof(buf), val).ptr;
            dest.append(buf, static_cast<size_t>(end - buf));
        }

        // Anything else that supports operator<<
        template <typename T,
            typename std::enable_if_t<!std::is_arithmetic_v<std::decay_t<T>> &&
            !std::is_same_v<std::decay_t<T>, std::string> &&
            !std::is_same_v<std::decay_t<T>, const char*> &&
            !std::is_same_v<std::decay_t<T>, char*>, int> = 0>
        inline void appendOne(std::string& dest, const T& val)
        {
            thread_local std::ostringstream oss;
            oss.str(std::string{});
            oss.clear();
            oss << val;
            dest += oss.str();
        }

        template <typename... Ts>
        inline void buildString(std::string& dest, Ts&&... args)
        {
            (appendOne(dest, std::forward<Ts>(args)), ...);
        }
    } // namespace detail

    struct LogMessage
    {
        Level level = INFO;
        int64_t microsSinceEpoch = 0;
        std::string id;
        std::string text;
    };

    // Bounded multi-producer / single-consumer ring. A full ring drops the newest message.
    class LogRing
    {
    public:
        explicit LogRing(size_t size) : buffer_(size), mask_(size - 1) {}

        bool tryPush(LogMessage&& msg)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (tail_ - head_ >= buffer_.size()) {
                ++dropped_;
                return false;
            }
            buffer_[tail_ & mask_] = std::move(msg);
            ++tail_;
            return true;
        }

        bool tryPop(LogMessage& out)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (head_ == tail_) return false;
            out = std::move(buffer_[head_ & mask_]);
            ++head_;
            return true;
        }

        uint64_t dropped() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return dropped_;
        }

    private:
        std::vector<LogMessage> buffer_;
        size_t mask_;
        uint64_t head_ = 0;
        uint64_t tail_ = 0;
        uint64_t dropped_ = 0;
        mutable std::mutex mutex_;
    };

    class Logger
    {
    public:
        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        static Logger& instance()
        {
            static Logger s;
            return s;
        }

        // ringSize is rounded up to a power of two
        void init(Level level, size_t ringSize, std::ostream& sink)
        {
            std::lock_guard<std::mutex> lock(lifecycleMutex_);
            if (running_.load(std::memory_order_acquire)) return;

            size_t capacity = 1;
            while (capacity < ringSize) capacity <<= 1;

            ring_ = std::make_unique<LogRing>(capacity);
            sink_ = &sink;
            currentLevel_.store(level, std::memory_order_relaxed);
            running_.store(true, std::memory_order_release);
            consumerThread_ = std::thread(&Logger::consumerLoop, this);
        }

        bool enabled(Level lv) const
        {
            return running_.load(std::memory_order_acquire) && lv >= currentLevel_.load(std::memory_order_relaxed);
        }

        template<typename IdType, typename... Args>
        void log(Level lv, IdType&& id, Args&&... args)
        {
            if (!enabled(lv)) return;

            std::string text;
            text.reserve(128);
            detail::buildString(text, std::forward<Args>(args)...);

            LogMessage msg;
            msg.level = lv;
            msg.microsSinceEpoch = nowMicrosSinceEpoch();
            msg.id = std::forward<IdType>(id);
            msg.text = std::move(text);

            std::lock_guard<std::mutex> lock(lifecycleMutex_);
            if (!ring_) return;
            ring_->tryPush(std::move(msg));
            wake_.notify_one();
        }

        void shutdown()
        {
            std::lock_guard<std::mutex> lock(lifecycleMutex_);
            if (!running_.exchange(false, std::memory_order_acq_rel)) return;

            wake_.notify_all();
            if (consumerThread_.joinable()) {
                consumerThread_.join();
            }

            if (ring_->dropped() > 0) {
                *sink_ << "[logger] " << ring_->dropped() << " message(s) dropped, ring was full\n";
            }
            sink_->flush();
            ring_.reset();
        }

    private:
        Logger() = default;
        ~Logger() { shutdown(); }

        static int64_t nowMicrosSinceEpoch()
        {
            using namespace std::chrono;
            return duration_cast<microseconds>(system_clock::now().time_since_epoch()).count();
        }

        void consumerLoop()
        {
            LogMessage msg;
            while (running_.load(std::memory_order_acquire))
            {
                while (ring_->tryPop(msg)) { printMessage(msg); }

                std::unique_lock<std::mutex> lock(waitMutex_);
                wake_.wait_for(lock, std::chrono::milliseconds(5));
            }

            // Drain any remaining
            while (ring_->tryPop(msg)) { printMessage(msg); }
        }

        void printMessage(const LogMessage& lm) const
        {
            using namespace std::chrono;
            const auto tp = system_clock::time_point(duration_cast<system_clock::duration>(microseconds(lm.microsSinceEpoch)));

            std::time_t t = system_clock::to_time_t(tp);
            std::tm tmBuf{};
#ifdef _WIN32
            gmtime_s(&tmBuf, &t);
#else
            gmtime_r(&t, &tmBuf);
#endif
            const auto msPart = (lm.microsSinceEpoch / 1000) % 1000;

            char timeBuf[32];
            std::snprintf(timeBuf, sizeof(timeBuf),
                "%02d:%02d:%02d.%03d",
                tmBuf.tm_hour, tmBuf.tm_min, tmBuf.tm_sec,
                static_cast<int>(msPart));

            *sink_ << "[" << timeBuf << "] "
                << "[" << levelToStr(lm.level) << "] ";
            if (!lm.id.empty()) {
                *sink_ << "[" << lm.id << "] ";
            }
            *sink_ << lm.text << "\n";
        }

        std::unique_ptr<LogRing> ring_;
        std::ostream* sink_ = &std::clog;
        std::atomic<Level> currentLevel_{ WARN };
        std::atomic<bool> running_{ false };
        std::thread consumerThread_;
        std::mutex lifecycleMutex_;
        std::mutex waitMutex_;
        std::condition_variable wake_;
    };

    //-----------------------------------
    // Public API
    //-----------------------------------
    inline void init(Level lv, size_t ringSize = 4096, std::ostream& sink = std::clog)
    {
        Logger::instance().init(lv, ringSize, sink);
    }

    inline void shutdown()
    {
        Logger::instance().shutdown();
    }

    template<typename IdType, typename... Args>
    inline void log(Level lv, IdType&& id, Args&&... args)
    {
        Logger::instance().log(lv, std::forward<IdType>(id), std::forward<Args>(args)...);
    }

    template<typename IdType, typename... Args>
    inline void trace(IdType&& id, Args&&... args) { log(TRACE, std::forward<IdType>(id), std::forward<Args>(args)...); }

    template<typename IdType, typename... Args>
    inline void debug(IdType&& id, Args&&... args) { log(DEBUG, std::forward<IdType>(id), std::forward<Args>(args)...); }

    template<typename IdType, typename... Args>
    inline void info(IdType&& id, Args&&... args) { log(INFO, std::forward<IdType>(id), std::forward<Args>(args)...); }

    template<typename IdType, typename... Args>
    inline void warn(IdType&& id, Args&&... args) { log(WARN, std::forward<IdType>(id), std::forward<Args>(args)...); }

    template<typename IdType, typename... Args>
    inline void error(IdType&& id, Args&&... args) { log(ERROR_L, std::forward<IdType>(id), std::forward<Args>(args)...); }

} // namespace snapmatch::logger
