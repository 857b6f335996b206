/*
 * Copyright (c) 2024-2025 Anthony J. Greenberg and Rebekah Rogers
 *
 * Redistribution and use in source and binary forms, with or without modification, are permitted provided that the following conditions are met:
 *
 * 1. Redistributions of source code must retain the above copyright notice, this list of conditions and the following disclaimer.
 *
 * 2. Redistributions in binary form must reproduce the above copyright notice, this list of conditions and the following disclaimer in the documentation and/or other materials provided with the distribution.
 *
 * 3. Neither the name of the copyright holder nor the names of its contributors may be used to endorse or promote products derived from this software without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO,
 * THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS
 * BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 * SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER
 * IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF
 * THE POSSIBILITY OF SUCH DAMAGE.
 */

/// Bounded multi-producer multi-consumer queue
/** \file
 * \author Anthony J. Greenberg and Rebekah Rogers
 * \copyright Copyright (c) 2024 Anthony J. Greenberg and Rebekah Rogers
 * \version 0.1
 *
 * Blocking queue used to pass variant records between the reader, worker, and writer threads.
 *
 */

#pragma once

#include <algorithm>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <utility>

namespace umiSpace {
	/** \brief Bounded blocking queue
	 *
	 * `push()` blocks while the queue is full, `pop()` blocks while it is empty.
	 * After `close()`, `pop()` drains the remaining items and then reports the end of input.
	 *
	 * \tparam T stored type
	 */
	template <typename T>
	class BoundedQueue {
	public:
		/** \brief Constructor with capacity
		 *
		 * \param[in] capacity maximal number of queued items (at least 1)
		 */
		explicit BoundedQueue(const size_t &capacity) : capacity_{std::max(capacity, static_cast<size_t>(1))} {};
		/** \brief Copy constructor (deleted) */
		BoundedQueue(const BoundedQueue<T> &toCopy) = delete;
		/** \brief Copy assignment operator (deleted) */
		BoundedQueue<T>& operator=(const BoundedQueue<T> &toCopy) = delete;
		/** \brief Move constructor (deleted) */
		BoundedQueue(BoundedQueue<T> &&toMove) = delete;
		/** \brief Move assignment operator (deleted) */
		BoundedQueue<T>& operator=(BoundedQueue<T> &&toMove) = delete;
		/** \brief Destructor */
		~BoundedQueue() = default;

		/** \brief Add an item
		 *
		 * Blocks while the queue is full.
		 *
		 * \param[in] item item to add
		 * \return `false` if the queue was closed and the item was not added
		 */
		bool push(T item) {
			std::unique_lock<std::mutex> lock(mutex_);
			notFull_.wait(lock, [this]{ return isClosed_ || (items_.size() < capacity_); });
			if (isClosed_) {
				return false;
			}
			items_.push_back( std::move(item) );
			lock.unlock();
			notEmpty_.notify_one();
			return true;
		};
		/** \brief Remove an item
		 *
		 * Blocks while the queue is empty and open.
		 *
		 * \param[out] item removed item
		 * \return `false` if the queue is closed and empty
		 */
		bool pop(T &item) {
			std::unique_lock<std::mutex> lock(mutex_);
			notEmpty_.wait(lock, [this]{ return isClosed_ || !items_.empty(); });
			if ( items_.empty() ) {
				return false;
			}
			item = std::move( items_.front() );
			items_.pop_front();
			lock.unlock();
			notFull_.notify_one();
			return true;
		};
		/** \brief Close the queue
		 *
		 * No items can be added after closing.
		 */
		void close() {
			{
				std::lock_guard<std::mutex> lock(mutex_);
				isClosed_ = true;
			}
			notEmpty_.notify_all();
			notFull_.notify_all();
		};
		/** \brief Queue capacity
		 *
		 * \return maximal number of items
		 */
		[[gnu::warn_unused_result]] size_t capacity() const noexcept { return capacity_; };
	private:
		/** \brief Maximal number of items */
		size_t capacity_;
		/** \brief Has the queue been closed? */
		bool isClosed_{false};
		/** \brief Queued items */
		std::deque<T> items_;
		/** \brief Guards all data */
		std::mutex mutex_;
		/** \brief Signals available space */
		std::condition_variable notFull_;
		/** \brief Signals available items */
		std::condition_variable notEmpty_;
	};
}
