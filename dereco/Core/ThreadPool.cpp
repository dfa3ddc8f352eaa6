#include "ThreadPool.hpp"
#include <Common/Exception.hpp>
#include <unistd.h>
#include <stdio.h>
#include <climits>

using namespace DERECO::Core;
using namespace std;

static ThreadPool globalPool(UINT_MAX);
namespace DERECO { namespace Core {
	ThreadPool *GlobalThreadPool = &globalPool;
}}

ThreadPool::ThreadPool(unsigned nWorkers, unsigned maxPending)
	: nWorkers(nWorkers), maxPending(maxPending > 0 ? maxPending : 1), nClients(0), stopping(false)
{
	long nCPUs = sysconf(_SC_NPROCESSORS_ONLN);
	if(nCPUs < 1) nCPUs = 1;
	if(this->nWorkers > (unsigned)nCPUs) this->nWorkers = nCPUs;
	if(this->nWorkers < 1) this->nWorkers = 1;

	pthread_mutex_init(&lock, NULL);
	pthread_cond_init(&condQueued, NULL);
	pthread_cond_init(&condDequeued, NULL);
}

ThreadPool::~ThreadPool()
{
	stopThreads();
	pthread_cond_destroy(&condDequeued);
	pthread_cond_destroy(&condQueued);
	pthread_mutex_destroy(&lock);
}

unsigned ThreadPool::getNWorkers() const
{
	return nWorkers;
}

void ThreadPool::acquire()
{
	pthread_mutex_lock(&lock);
	bool first = (nClients == 0);
	nClients++;
	pthread_mutex_unlock(&lock);
	if(first) startThreads();
}

void ThreadPool::release()
{
	pthread_mutex_lock(&lock);
	bool last = false;
	if(nClients > 0) {
		nClients--;
		last = (nClients == 0);
	}
	pthread_mutex_unlock(&lock);
	if(last) stopThreads();
}

void ThreadPool::startThreads()
{
	pthread_mutex_lock(&lock);
	stopping = false;
	pthread_mutex_unlock(&lock);

	for(unsigned i = 0; i < nWorkers; i++) {
		pthread_t thread;
		int r = pthread_create(&thread, NULL, threadMain, (void *)this);
		if(r != 0) {
			if(threads.empty())
				throw DERECO::Common::OSError(r, "pthread_create");
			fprintf(stderr, "WARNING: running with %u of %u worker threads\n", (unsigned)threads.size(), nWorkers);
			break;
		}
		threads.push_back(thread);
	}
}

void ThreadPool::stopThreads()
{
	pthread_mutex_lock(&lock);
	stopping = true;
	pthread_mutex_unlock(&lock);
	pthread_cond_broadcast(&condQueued);

	for(unsigned i = 0; i < threads.size(); i++) {
		pthread_join(threads[i], NULL);
	}
	threads.clear();
}

bool ThreadPool::isSaturated()
{
	pthread_mutex_lock(&lock);
	bool r = pending.size() >= maxPending;
	pthread_mutex_unlock(&lock);
	return r;
}

void ThreadPool::submit(Job *job)
{
	pthread_mutex_lock(&lock);
	while(pending.size() >= maxPending) {
		pthread_cond_wait(&condDequeued, &lock);
	}
	pending.push_back(job);
	pthread_cond_signal(&condQueued);
	pthread_mutex_unlock(&lock);
}

void *ThreadPool::threadMain(void *arg)
{
	ThreadPool *pool = (ThreadPool *)arg;

	while(true) {
		pthread_mutex_lock(&pool->lock);
		// Pending jobs are drained before a stop takes effect
		while(pool->pending.empty() && !pool->stopping) {
			pthread_cond_wait(&pool->condQueued, &pool->lock);
		}
		if(pool->pending.empty()) {
			pthread_mutex_unlock(&pool->lock);
			break;
		}
		Job *job = pool->pending.front();
		pool->pending.pop_front();
		pthread_cond_signal(&pool->condDequeued);
		pthread_mutex_unlock(&pool->lock);

		job->run();
		job->complete();
	}
	return NULL;
}

ThreadPool::Job::Job()
	: finished(false)
{
	pthread_mutex_init(&lock, NULL);
	pthread_cond_init(&condFinished, NULL);
}

ThreadPool::Job::~Job()
{
	pthread_cond_destroy(&condFinished);
	pthread_mutex_destroy(&lock);
}

void ThreadPool::Job::complete()
{
	// The owner may delete the job as soon as it sees it finished
	pthread_mutex_lock(&lock);
	finished = true;
	pthread_cond_signal(&condFinished);
	pthread_mutex_unlock(&lock);
}

bool ThreadPool::Job::isFinished()
{
	pthread_mutex_lock(&lock);
	bool r = finished;
	pthread_mutex_unlock(&lock);
	return r;
}

void ThreadPool::Job::wait()
{
	pthread_mutex_lock(&lock);
	while(!finished)
		pthread_cond_wait(&condFinished, &lock);
	pthread_mutex_unlock(&lock);
}
