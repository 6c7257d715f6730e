/**
 * @file latest_slot.h
 * @brief 최신 값 하나만 보관하는 스레드 간 우편함 (크기 1 큐)
 *
 * 생산자가 소비자보다 빠르면 대기 중인 값을 새 값으로 덮어씀.
 * 오래된 프레임/요청이 쌓이지 않으므로 메모리와 지연이 한정됨.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <utility>

namespace backdrop_sdk {

/**
 * @brief LatestSlot::put() 결과
 */
enum class SlotPutResult : int {
    Stored = 0,     ///< 빈 우편함에 저장
    Replaced = 1,   ///< 꺼내지 않은 값을 버리고 교체
    Closed = 2      ///< 닫혀 있어 새 값을 버림
};

/**
 * @brief 최신 값 우편함
 *
 * @tparam T 이동 가능한 값 타입
 *
 * @note 스레드 안전. 소비자는 하나를 가정.
 */
template <typename T>
class LatestSlot {
public:
    LatestSlot() = default;

    LatestSlot(const LatestSlot&) = delete;
    LatestSlot& operator=(const LatestSlot&) = delete;

    /**
     * @brief 값 넣기
     *
     * 아직 꺼내지 않은 값이 있으면 버리고 교체.
     *
     * @return 저장/교체/닫힘 여부
     */
    SlotPutResult put(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (closed_) {
            return SlotPutResult::Closed;
        }

        const bool replaced = value_.has_value();
        value_ = std::move(item);
        if (replaced) {
            ++replaced_count_;
        }
        notify(lock);
        return replaced ? SlotPutResult::Replaced : SlotPutResult::Stored;
    }

    /**
     * @brief 값 꺼내기
     *
     * timeout_ms 동안 기다려도 값이 없거나 닫히면 false.
     */
    bool pop(T& item, int timeout_ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!value_.has_value() && !closed_) {
            cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                         [this] { return value_.has_value() || closed_; });
        }

        if (!value_.has_value()) {
            return false;  // 시간 초과 또는 닫힘
        }

        item = std::move(*value_);
        value_.reset();
        return true;
    }

    /// 대기 중인 값을 버리고 닫음. 대기 중인 pop()을 깨움
    void close() {
        std::unique_lock<std::mutex> lock(mutex_);
        closed_ = true;
        value_.reset();
        notify(lock);
    }

    /// 다시 열기 (재시작용)
    void reopen() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = false;
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return !value_.has_value();
    }

    /// 덮어써서 버린 값의 누적 개수
    uint64_t replacedCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return replaced_count_;
    }

private:
    void notify(std::unique_lock<std::mutex>& lock) {
        lock.unlock();  // 깨어난 스레드가 바로 다시 막히지 않도록 먼저 해제
        cv_.notify_all();
    }

    std::optional<T> value_;
    bool closed_ = false;
    uint64_t replaced_count_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace backdrop_sdk
