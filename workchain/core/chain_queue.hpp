/*******************************************************************************
 * workchain/core/chain_queue.hpp
 *
 * Unbounded FIFO queues built from a singly-linked chain of nodes with a
 * permanent empty tail node, and separate head and tail locks.
 *
 * Part of Project Workchain
 *
 * Copyright (C) 2026 Workchain Contributors
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef WORKCHAIN_CORE_CHAIN_QUEUE_HEADER
#define WORKCHAIN_CORE_CHAIN_QUEUE_HEADER

#include <workchain/common/logger.hpp>

#include <tlx/die.hpp>

#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <new>
#include <utility>

namespace workchain {
namespace core {

//! Options of a ChainQueue, combined as bit set.
enum ChainQueueFlags : unsigned {
    //! maintain an atomic item count, enables size().
    kCounted = 1,
    //! exactly one consumer: the head lock is elided and all head-side
    //! operations go through the one ChainQueue::Reader.
    kSingleReader = 2,
    //! enable blocking Dequeue() with optional timeout, and CancelWait().
    kSignaled = 4
};

/*!
 * ChainQueue is an unbounded multi-producer FIFO queue. The items are held in a
 * singly-linked chain which always ends in one empty node, the tail. Enqueue
 * fills the tail and appends a new empty node, hence it never needs to check
 * whether the chain is empty. Dequeue takes the head node if it has a
 * successor. Producers only touch the tail under the tail lock and consumers
 * only touch the head under the head lock, hence they do not contend unless
 * the queue is nearly empty, and then only on the atomic next link.
 *
 * The Flags select counting, a single consumer, and blocking dequeue, see
 * ChainQueueFlags and the aliases at the end of this file.
 *
 * A single-reader queue has no head lock. Its consumer must obtain the Reader
 * handle via reader(), and only one Reader may exist at any time. The Reader
 * may be moved to the consuming thread, but it must not be used from two
 * threads concurrently: that contract cannot be checked and breaking it races
 * on the head of the chain.
 *
 * Nodes are allocated via Allocator, rebound to the internal node type. The
 * allocator is used concurrently by producers and consumers.
 *
 * The queue must outlive all threads which use it, blocked consumers included:
 * call Destroy() to wake them and join them before destruction.
 */
template <typename T, unsigned Flags, typename Allocator = std::allocator<T> >
class ChainQueue
{
    static constexpr bool debug = false;

public:
    using value_type = T;
    using reference = T &;
    using const_reference = const T &;
    using size_type = std::size_t;
    using allocator_type = Allocator;

    static constexpr bool counted = (Flags & kCounted) != 0;
    static constexpr bool single_reader = (Flags & kSingleReader) != 0;
    static constexpr bool signaled = (Flags & kSignaled) != 0;

    //! Dequeue() timeouts from this on wait without bound. Keeps the deadline
    //! representable in steady_clock's nanoseconds.
    static constexpr std::chrono::hours max_timeout { 24 * 365 * 100 };

    class Reader;

private:
    //! chain link. value is constructed iff next is set, i.e. the node is not
    //! the tail.
    struct Node {
        std::atomic<Node*> next { nullptr };
        union {
            T value;
        };

        Node() { }
        ~Node() { }
    };

    using NodeAllocator =
        typename std::allocator_traits<Allocator>::template rebind_alloc<Node>;
    using NodeTraits = std::allocator_traits<NodeAllocator>;

    using steady_clock = std::chrono::steady_clock;

    NodeAllocator alloc_;

    //! lock for head_, unused for single-reader queues.
    std::mutex head_mutex_;
    //! lock for tail_
    std::mutex tail_mutex_;

    //! first node of the chain, equals tail_ if empty.
    Node* head_;
    //! empty node at the end of the chain.
    Node* tail_;

    //! number of items, maintained only if counted.
    std::atomic<size_t> count_ { 0 };

    //! set by Destroy()
    std::atomic<bool> destroyed_ { false };

    //! protects generation_ and reader_taken_, and the condition variable.
    std::mutex wait_mutex_;
    //! condition variable signaled by Enqueue(), CancelWait() and Destroy().
    std::condition_variable cv_;
    //! number of threads in Dequeue() that may sleep on cv_.
    std::atomic<size_t> waiters_ { 0 };
    //! cancellation generation, incremented by CancelWait().
    uint64_t generation_ = 0;
    //! whether a Reader exists, single-reader queues only.
    bool reader_taken_ = false;

public:
    //! Construct an empty queue: a chain of only the tail node.
    explicit ChainQueue(const Allocator& alloc = Allocator())
        : alloc_(alloc) {
        head_ = tail_ = NewNode();
    }

    //! non-copyable: delete copy-constructor
    ChainQueue(const ChainQueue&) = delete;
    //! non-copyable: delete assignment operator
    ChainQueue& operator = (const ChainQueue&) = delete;

    //! Destroy() the queue and release the tail node. A Reader must not
    //! outlive its queue.
    ~ChainQueue() {
        die_unless(!reader_taken_);
        Destroy();
        ReleaseChain(head_, nullptr);
    }

    //! Pushes a copy of source onto back of the queue.
    bool Enqueue(const T& source) {
        return Emplace(source);
    }

    //! Pushes given element into the queue by utilizing element's move
    //! constructor
    bool Enqueue(T&& elem) {
        return Emplace(std::move(elem));
    }

    //! Constructs a new element at the back of the queue. Never blocks except
    //! momentarily on the tail lock. Returns false and drops the element only
    //! if the queue was destroyed.
    template <typename... Args>
    bool Emplace(Args&& ... args) {
        // allocate the new tail outside of the lock.
        Node* new_tail = NewNode();
        {
            std::unique_lock<std::mutex> lock(tail_mutex_);
            if (destroyed_) {
                lock.unlock();
                LOG << "ChainQueue::Emplace() on destroyed queue, dropped.";
                DeleteNode(new_tail);
                return false;
            }
            Node* node = tail_;
            try {
                ::new (static_cast<void*>(std::addressof(node->value)))
                T(std::forward<Args>(args) ...);
            }
            catch (...) {
                lock.unlock();
                DeleteNode(new_tail);
                throw;
            }
            // count before publishing, such that count_ never underflows.
            if (counted) ++count_;
            // publish the item. A consumer may take node right after this
            // store, before tail_ is advanced, which is fine since only
            // producers read tail_.
            node->next.store(new_tail);
            tail_ = new_tail;
        }
        if (signaled) NotifyWaiters();
        return true;
    }

    //! If value is available, pops it from the queue, move it to destination,
    //! destroying the original position. Otherwise does nothing and returns
    //! false. Not for single-reader queues, see Reader.
    bool TryDequeue(T& destination) {
        static_assert(!single_reader,
                      "single-reader ChainQueue: dequeue via reader()");
        return DoTryDequeue(destination);
    }

    //! If value is available, pops it from the queue, move it to
    //! destination. If no item is in the queue, wait until there is one.
    //! Returns false if the wait was cancelled by CancelWait() or Destroy().
    bool Dequeue(T& destination) {
        static_assert(!single_reader,
                      "single-reader ChainQueue: dequeue via reader()");
        return DoDequeue(destination, false, steady_clock::time_point());
    }

    //! Same as Dequeue(), but returns false after timeout expired. A negative
    //! timeout, or one of max_timeout or more, waits without bound.
    bool Dequeue(T& destination, std::chrono::milliseconds timeout) {
        static_assert(!single_reader,
                      "single-reader ChainQueue: dequeue via reader()");
        if (IsUnbounded(timeout))
            return DoDequeue(destination, false, steady_clock::time_point());
        return DoDequeue(destination, true, steady_clock::now() + timeout);
    }

    //! Same as Dequeue() with timeout, but returns false if CancelWait() was
    //! called at any time after generation was read via wait_generation(). This
    //! closes the gap between a consumer's own exit check and its wait.
    bool Dequeue(T& destination, std::chrono::milliseconds timeout,
                 uint64_t generation) {
        static_assert(!single_reader,
                      "single-reader ChainQueue: dequeue via reader()");
        if (IsUnbounded(timeout))
            return DoDequeue(destination, generation,
                             false, steady_clock::time_point());
        return DoDequeue(destination, generation,
                         true, steady_clock::now() + timeout);
    }

    //! Returns the current cancellation generation, see CancelWait().
    uint64_t wait_generation() {
        static_assert(signaled,
                      "wait_generation() requires a signaled ChainQueue");
        std::lock_guard<std::mutex> lock(wait_mutex_);
        return generation_;
    }

    //! Returns true if the queue contains no items.
    bool empty() {
        static_assert(!single_reader,
                      "single-reader ChainQueue: empty() via reader()");
        return DoEmpty();
    }

    //! Returns the number of items. The count is updated atomically but not
    //! together with the chain, hence it is only approximate while other
    //! threads enqueue or dequeue.
    size_t size() const {
        static_assert(counted, "size() requires a counted ChainQueue");
        return count_.load();
    }

    //! Wake all threads currently blocked in Dequeue(), which then return
    //! false. Later Dequeue() calls wait normally again.
    void CancelWait() noexcept {
        static_assert(signaled, "CancelWait() requires a signaled ChainQueue");
        {
            std::lock_guard<std::mutex> lock(wait_mutex_);
            ++generation_;
        }
        cv_.notify_all();
    }

    //! Remove all items.
    void Clear() noexcept {
        static_assert(!single_reader,
                      "single-reader ChainQueue: Clear() via reader()");
        DoClear();
    }

    //! Remove all items for which pred(item) is true and return their
    //! number. pred is called with both locks held and must not use the queue.
    template <typename Predicate>
    size_t RemoveIf(Predicate pred) {
        static_assert(!single_reader,
                      "single-reader ChainQueue: RemoveIf() via reader()");
        return DoRemoveIf(pred);
    }

    //! Shut the queue down permanently: wake all waiters, drop all items and
    //! drop any further Enqueue(). Idempotent. For a single-reader queue with a
    //! living Reader the items are released when the Reader is.
    void Destroy() noexcept {
        bool release = true;
        {
            std::lock_guard<std::mutex> lock(wait_mutex_);
            if (destroyed_) return;
            destroyed_ = true;
            if (single_reader && reader_taken_) release = false;
        }
        cv_.notify_all();
        if (release) DoClear();
    }

    //! Whether Destroy() was called.
    bool destroyed() const {
        return destroyed_;
    }

    /*!
     * The consumer side of a single-reader ChainQueue. Movable, not copyable.
     * The head-side operations need no lock, because the Reader is unique.
     */
    class Reader
    {
    public:
        //! construct an empty Reader
        Reader() = default;

        //! non-copyable: delete copy-constructor
        Reader(const Reader&) = delete;
        //! non-copyable: delete assignment operator
        Reader& operator = (const Reader&) = delete;

        //! move-constructor
        Reader(Reader&& other) noexcept
            : queue_(other.queue_) {
            other.queue_ = nullptr;
        }

        //! move-assignment
        Reader& operator = (Reader&& other) noexcept {
            if (this == &other) return *this;
            reset();
            queue_ = other.queue_;
            other.queue_ = nullptr;
            return *this;
        }

        //! release the queue's reader slot
        ~Reader() {
            reset();
        }

        //! whether this Reader is attached to a queue
        bool valid() const { return queue_ != nullptr; }

        //! Detach the Reader, such that the queue may hand out a new one.
        void reset() noexcept {
            if (queue_ == nullptr) return;
            queue_->ReleaseReader();
            queue_ = nullptr;
        }

        //! see ChainQueue::TryDequeue()
        bool TryDequeue(T& destination) {
            assert(queue_);
            return queue_->DoTryDequeue(destination);
        }

        //! see ChainQueue::Dequeue()
        bool Dequeue(T& destination) {
            static_assert(signaled,
                          "Dequeue() requires a signaled ChainQueue");
            assert(queue_);
            return queue_->DoDequeue(
                destination, false, steady_clock::time_point());
        }

        //! see ChainQueue::Dequeue()
        bool Dequeue(T& destination, std::chrono::milliseconds timeout) {
            static_assert(signaled,
                          "Dequeue() requires a signaled ChainQueue");
            assert(queue_);
            if (IsUnbounded(timeout))
                return queue_->DoDequeue(
                    destination, false, steady_clock::time_point());
            return queue_->DoDequeue(
                destination, true, steady_clock::now() + timeout);
        }

        //! see ChainQueue::empty()
        bool empty() const {
            assert(queue_);
            return queue_->DoEmpty();
        }

        //! see ChainQueue::Clear()
        void Clear() noexcept {
            assert(queue_);
            queue_->DoClear();
        }

        //! see ChainQueue::RemoveIf()
        template <typename Predicate>
        size_t RemoveIf(Predicate pred) {
            assert(queue_);
            return queue_->DoRemoveIf(pred);
        }

    private:
        friend class ChainQueue;

        explicit Reader(ChainQueue* queue) : queue_(queue) { }

        ChainQueue* queue_ = nullptr;
    };

    //! Return the one consumer handle of a single-reader queue. Dies if another
    //! Reader exists.
    Reader reader() {
        static_assert(single_reader,
                      "reader() requires a single-reader ChainQueue");
        std::lock_guard<std::mutex> lock(wait_mutex_);
        die_unless(!reader_taken_);
        reader_taken_ = true;
        return Reader(this);
    }

private:
    Node* NewNode() {
        Node* node = NodeTraits::allocate(alloc_, 1);
        NodeTraits::construct(alloc_, node);
        return node;
    }

    static bool IsUnbounded(std::chrono::milliseconds timeout) {
        return timeout.count() < 0 || timeout >= max_timeout;
    }

    void DeleteNode(Node* node) noexcept {
        NodeTraits::destroy(alloc_, node);
        NodeTraits::deallocate(alloc_, node, 1);
    }

    //! Release the nodes from begin up to but excluding end, including their
    //! values where constructed.
    void ReleaseChain(Node* begin, Node* end) noexcept {
        while (begin != end) {
            Node* next = begin->next.load();
            if (next != nullptr) begin->value.~T();
            DeleteNode(begin);
            begin = next;
        }
    }

    //! lock the head unless there is only one reader.
    std::unique_lock<std::mutex> LockHead() {
        if (single_reader)
            return std::unique_lock<std::mutex>(head_mutex_, std::defer_lock);
        return std::unique_lock<std::mutex>(head_mutex_);
    }

    bool DoEmpty() {
        std::unique_lock<std::mutex> lock = LockHead();
        return head_->next.load() == nullptr;
    }

    bool DoTryDequeue(T& destination) {
        if (destroyed_) return false;

        Node* node;
        {
            std::unique_lock<std::mutex> lock = LockHead();
            node = head_;
            Node* next = node->next.load();
            if (next == nullptr)
                return false;
            // the next node may be the tail now.
            head_ = next;
            if (counted) --count_;
        }

        destination = std::move(node->value);
        node->value.~T();
        DeleteNode(node);
        return true;
    }

    bool DoDequeue(T& destination,
                   bool timed, steady_clock::time_point deadline) {
        static_assert(signaled, "Dequeue() requires a signaled ChainQueue");

        uint64_t generation;
        {
            std::lock_guard<std::mutex> lock(wait_mutex_);
            generation = generation_;
        }
        return DoDequeue(destination, generation, timed, deadline);
    }

    bool DoDequeue(T& destination, uint64_t generation,
                   bool timed, steady_clock::time_point deadline) {
        while (true) {
            if (DoTryDequeue(destination))
                return true;

            std::unique_lock<std::mutex> lock(wait_mutex_);
            if (destroyed_ || generation != generation_)
                return false;

            // register as waiter before the final emptiness check in the
            // predicate: an Enqueue() either is seen by that check, or sees
            // the waiter and notifies through wait_mutex_.
            ++waiters_;
            auto ready = [this, generation]() {
                             return destroyed_ || generation != generation_ ||
                                    !DoEmpty();
                         };
            bool woken = true;
            if (timed)
                woken = cv_.wait_until(lock, deadline, ready);
            else
                cv_.wait(lock, ready);
            --waiters_;

            if (!woken) {
                sLOG << "ChainQueue::Dequeue() timed out";
                return false;
            }
            if (destroyed_ || generation != generation_) {
                sLOG << "ChainQueue::Dequeue() cancelled"
                     << "destroyed" << destroyed_.load();
                return false;
            }
            // else: another consumer may take the item first, then wait again.
        }
    }

    void NotifyWaiters() {
        if (waiters_.load() == 0) return;
        {
            // pass through the mutex: the waiter is either before its
            // emptiness check or already blocked on cv_.
            std::lock_guard<std::mutex> lock(wait_mutex_);
        }
        cv_.notify_all();
    }

    //! Unlink all items, keeping the tail node as the whole chain.
    void DoClear() noexcept {
        Node* old_head;
        Node* end;
        {
            std::unique_lock<std::mutex> head_lock = LockHead();
            std::lock_guard<std::mutex> tail_lock(tail_mutex_);
            old_head = head_;
            end = tail_;
            head_ = tail_;
            count_ = 0;
        }
        ReleaseChain(old_head, end);
    }

    template <typename Predicate>
    size_t DoRemoveIf(Predicate& pred) {
        // removed nodes are relinked into a garbage chain via next.
        Node* garbage = nullptr;
        size_t removed = 0;
        {
            std::unique_lock<std::mutex> head_lock = LockHead();
            std::lock_guard<std::mutex> tail_lock(tail_mutex_);

            Node* prev = nullptr;
            Node* node = head_;
            while (node != tail_) {
                Node* next = node->next.load();
                if (pred(static_cast<const T&>(node->value))) {
                    if (prev != nullptr)
                        prev->next.store(next);
                    else
                        head_ = next;
                    node->next.store(garbage);
                    garbage = node;
                    ++removed;
                }
                else {
                    prev = node;
                }
                node = next;
            }
            if (counted) count_ -= removed;
        }

        while (garbage != nullptr) {
            Node* next = garbage->next.load();
            garbage->value.~T();
            DeleteNode(garbage);
            garbage = next;
        }
        return removed;
    }

    void ReleaseReader() noexcept {
        bool release;
        {
            std::lock_guard<std::mutex> lock(wait_mutex_);
            reader_taken_ = false;
            release = destroyed_;
        }
        // Destroy() left the items to the Reader.
        if (release) DoClear();
    }
};

template <typename T, unsigned Flags, typename Allocator>
constexpr std::chrono::hours ChainQueue<T, Flags, Allocator>::max_timeout;

//! Counted multi-reader queue with blocking Dequeue().
template <typename T, typename Allocator = std::allocator<T> >
using ConcurrentQueue = ChainQueue<T, kCounted | kSignaled, Allocator>;

//! Uncounted multi-reader queue with blocking Dequeue().
template <typename T, typename Allocator = std::allocator<T> >
using CountlessConcurrentQueue = ChainQueue<T, kSignaled, Allocator>;

//! Counted single-reader queue with blocking Dequeue().
template <typename T, typename Allocator = std::allocator<T> >
using SingleReaderConcurrentQueue =
    ChainQueue<T, kCounted | kSingleReader | kSignaled, Allocator>;

//! Counted multi-reader queue, TryDequeue() only.
template <typename T, typename Allocator = std::allocator<T> >
using CountedQueue = ChainQueue<T, kCounted, Allocator>;

//! Uncounted multi-reader queue, TryDequeue() only.
template <typename T, typename Allocator = std::allocator<T> >
using CountlessQueue = ChainQueue<T, 0, Allocator>;

//! Uncounted single-reader queue, TryDequeue() only.
template <typename T, typename Allocator = std::allocator<T> >
using SingleReaderCountlessQueue = ChainQueue<T, kSingleReader, Allocator>;

} // namespace core
} // namespace workchain

#endif // !WORKCHAIN_CORE_CHAIN_QUEUE_HEADER

/******************************************************************************/
