#ifndef __DERECO__CORE__THREADPOOL_HPP__DEFINED__
#define __DERECO__CORE__THREADPOOL_HPP__DEFINED__

#include <pthread.h>
#include <deque>
#include <vector>

namespace DERECO { namespace Core {

	class ThreadPool {
	public:
		// Unit of work. The submitter keeps ownership and must wait()
		// before deleting it.
		class Job {
		public:
			Job();
			virtual ~Job();
			bool isFinished();
			void wait();

		protected:
			virtual void run() = 0;

		private:
			bool finished;
			pthread_mutex_t lock;
			pthread_cond_t condFinished;
			void complete();

			friend class ThreadPool;
		};

		// nWorkers is capped at the number of online CPUs
		ThreadPool(unsigned nWorkers, unsigned maxPending = 2);
		~ThreadPool();

		unsigned getNWorkers() const;

		// Threads run while at least one client holds the pool
		void acquire();
		void release();

		bool isSaturated();
		// Blocks while maxPending jobs are waiting for a thread
		void submit(Job *job);

	private:
		unsigned nWorkers;
		unsigned maxPending;
		unsigned nClients;
		bool stopping;
		std::deque<Job *> pending;
		std::vector<pthread_t> threads;

		pthread_mutex_t lock;
		pthread_cond_t condQueued;
		pthread_cond_t condDequeued;

		void startThreads();
		void stopThreads();
		static void *threadMain(void *arg);
	};

	extern ThreadPool *GlobalThreadPool;
}}
#endif
