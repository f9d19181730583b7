// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project
// Copyright The NAS Media Catalog Project

#ifndef NMC_UPNP_WORKQUEUE_HXX
#define NMC_UPNP_WORKQUEUE_HXX

#include "thread/Mutex.hxx"
#include "thread/Cond.hxx"
#include "thread/Name.hxx"

#include <functional>
#include <queue>
#include <string>
#include <thread>
#include <vector>

/**
 * A WorkQueue manages the synchronisation around a queue of work
 * items, where a client thread queues tasks and a number of worker
 * threads take and execute them.
 *
 * There is no individual task status return.  Workers which need to
 * report a result store it at a location identified by the task
 * (e.g. an index into a result vector owned by the client).
 */
template<class T>
class WorkQueue {
	const std::string name;

	std::function<void(T &&)> handler;

	std::vector<std::thread> threads;

	std::queue<T> queue;

	Mutex mutex;

	/**
	 * Signalled by the client when a task is queued or the queue
	 * is terminated.
	 */
	Cond worker_cond;

	/**
	 * Signalled by the workers when a task was finished.
	 */
	Cond client_cond;

	/**
	 * The number of tasks currently being executed.
	 */
	unsigned busy = 0;

	bool terminate = false;

public:
	explicit WorkQueue(const char *_name)
		:name(_name) {}

	~WorkQueue() noexcept {
		SetTerminateAndWait();
	}

	WorkQueue(const WorkQueue &) = delete;
	WorkQueue &operator=(const WorkQueue &) = delete;

	/**
	 * Start the worker threads.  Each one loops taking tasks and
	 * passing them to the given handler.  The handler must not
	 * throw.
	 *
	 * Throws std::system_error if a thread could not be created.
	 */
	template<typename F>
	void Start(unsigned n_workers, F &&_handler) {
		handler = std::forward<F>(_handler);

		for (unsigned i = 0; i < n_workers; ++i)
			threads.emplace_back([this, i]{ Run(i); });
	}

	/**
	 * Add an item to the work queue.
	 *
	 * @return false if the queue is being terminated
	 */
	bool Put(T t) {
		const std::scoped_lock lock{mutex};

		if (terminate)
			return false;

		queue.push(std::move(t));
		worker_cond.notify_one();
		return true;
	}

	/**
	 * Wait until the queue is empty and all workers are idle.
	 * This is only reliable if no other thread adds tasks
	 * concurrently.
	 */
	void WaitIdle() noexcept {
		std::unique_lock lock{mutex};
		client_cond.wait(lock, [this]{
			return terminate || (queue.empty() && busy == 0);
		});
	}

	/**
	 * Tell the workers to exit, and wait for them.  Tasks still
	 * on the queue are discarded, so call WaitIdle() first for an
	 * orderly shutdown.
	 */
	void SetTerminateAndWait() noexcept {
		{
			const std::scoped_lock lock{mutex};
			terminate = true;
			worker_cond.notify_all();
			client_cond.notify_all();
		}

		for (auto &i : threads)
			i.join();
		threads.clear();

		const std::scoped_lock lock{mutex};
		std::queue<T>{}.swap(queue);
		terminate = false;
	}

private:
	/**
	 * Take a task from the queue.  Called from a worker.
	 *
	 * @return false if the queue is being terminated
	 */
	bool Take(T &t) noexcept {
		std::unique_lock lock{mutex};
		worker_cond.wait(lock, [this]{
			return terminate || !queue.empty();
		});

		if (terminate)
			return false;

		t = std::move(queue.front());
		queue.pop();
		++busy;
		client_cond.notify_all();
		return true;
	}

	void Done() noexcept {
		const std::scoped_lock lock{mutex};
		--busy;
		client_cond.notify_all();
	}

	void Run(unsigned i) noexcept {
		FmtThreadName("{}:{}", name, i);

		T t;
		while (Take(t)) {
			handler(std::move(t));
			Done();
		}
	}
};

#endif
