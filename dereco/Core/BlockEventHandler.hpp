#ifndef __DERECO__CORE__BLOCKEVENTHANDLER_HPP__DEFINED__
#define __DERECO__CORE__BLOCKEVENTHANDLER_HPP__DEFINED__
#include <Core/EventSourceSink.hpp>
#include <Core/EventBuffer.hpp>
#include <Core/ThreadPool.hpp>
#include <Common/Exception.hpp>
#include <pthread.h>
#include <stdio.h>
#include <time.h>
#include <deque>

namespace DERECO { namespace Core {

	// Pipeline stage which processes independent event blocks on a thread pool.
	// Blocks are passed downstream in the order they were pushed.
	// An Exception raised by handleEvents() is rethrown on the thread which
	// drives the pipeline, from pushEvents() or finish().
	template <class TEventInput, class TEventOutput>
	class BlockEventHandler : 
		public EventSink<TEventInput>,
		public EventSource<TEventOutput> {
	public:
		BlockEventHandler(EventSink<TEventOutput> *sink, bool singleWorker = false, ThreadPool *pool = GlobalThreadPool);
		virtual ~BlockEventHandler();
		virtual void pushEvents(EventBuffer<TEventInput> *buffer);
		virtual void finish();
		virtual void report();
		virtual void discard();

	protected:
		// Must return a buffer with as many events as inBuffer.
		// Ownership of inBuffer passes to this call.
		virtual EventBuffer<TEventOutput> * handleEvents(EventBuffer<TEventInput> *inBuffer) = 0;

	private:
		bool singleWorker;
		ThreadPool *threadPool;
		
		unsigned peakThreads;
		unsigned stepProcessingNBlocks;
		double stepProcessingTime;
		unsigned long stepProcessingNInputEvents;
	
		void extractWorker();
		void discardWorkers();

		class Worker : public ThreadPool::Job {
		public:
			Worker(BlockEventHandler<TEventInput, TEventOutput> *master, 
				EventBuffer<TEventInput> *inBuffer);

			BlockEventHandler<TEventInput, TEventOutput> *master;
			EventBuffer<TEventInput> *inBuffer;
			EventBuffer<TEventOutput> *outBuffer;
			DERECO::Common::ExceptionCarrier *error;
			double runTime;
			size_t runEvents;

		protected:
			void run();
		};

		std::deque<Worker *> workers;
	};

#include "BlockEventHandler.tpp"

}}
#endif
