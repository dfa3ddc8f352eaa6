
template <class TEventInput, class TEventOutput>
BlockEventHandler<TEventInput, TEventOutput>::BlockEventHandler(EventSink<TEventOutput> *sink, bool singleWorker, ThreadPool *pool)
: EventSource<TEventOutput>(sink), singleWorker(singleWorker), threadPool(singleWorker ? new ThreadPool(1) : pool)
{
	threadPool->acquire();

	peakThreads = 0;
	stepProcessingNBlocks = 0;
	stepProcessingTime = 0;
	stepProcessingNInputEvents = 0;
}

template <class TEventInput, class TEventOutput>
BlockEventHandler<TEventInput, TEventOutput>::~BlockEventHandler()
{
	discardWorkers();
	threadPool->release();
	if(singleWorker)
		delete threadPool;
}

template <class TEventInput, class TEventOutput>
void BlockEventHandler<TEventInput, TEventOutput>::pushEvents(EventBuffer<TEventInput> *buffer)
{	
	if(buffer == NULL) 
		return;

	stepProcessingNBlocks++;
	peakThreads = workers.size() > peakThreads ? workers.size() : peakThreads;	
	
	try {
		while(workers.size() > 0 && workers.front()->isFinished()) {
			extractWorker();
		}

		while(workers.size() > 0 && threadPool->isSaturated()) {
			extractWorker();
		}
		
		while(singleWorker && workers.size() > 0) {
			extractWorker();
		}
	}
	catch(DERECO::Common::Exception &) {
		delete buffer;
		throw;
	}

	Worker *worker = new Worker(this, buffer);
	workers.push_back(worker);
	threadPool->submit(worker);
}

template <class TEventInput, class TEventOutput>
void BlockEventHandler<TEventInput, TEventOutput>::finish()
{
	while (workers.size() > 0) {
		extractWorker();
	}
	this->sink->finish();
}

template <class TEventInput, class TEventOutput>
void BlockEventHandler<TEventInput, TEventOutput>::discard()
{
	discardWorkers();
	this->sink->discard();
}

template <class TEventInput, class TEventOutput>
void BlockEventHandler<TEventInput, TEventOutput>::report()
{
	fprintf(stderr, " thread pool\n");
	if(stepProcessingNBlocks > 0)
		fprintf(stderr, "   %10.4lf milliseconds/block\n", stepProcessingTime/stepProcessingNBlocks*1000);
	fprintf(stderr, "   %10u peak threads\n", peakThreads);

	this->sink->report();
}

template <class TEventInput, class TEventOutput>
void BlockEventHandler<TEventInput, TEventOutput>::extractWorker()
{
	Worker *worker = workers.front();
	workers.pop_front();	
	worker->wait();

	EventBuffer<TEventOutput> *outBuffer = worker->outBuffer;
	DERECO::Common::ExceptionCarrier *error = worker->error;
	size_t nInputEvents = worker->runEvents;
	stepProcessingTime += worker->runTime;	
	stepProcessingNInputEvents += nInputEvents;
	if(error != NULL) {
		// handleEvents() did not complete, the input block is still ours
		delete worker->inBuffer;
	}
	delete worker;

	if(error != NULL) {
		DERECO::Common::ExceptionCarrier carried(*error);
		delete error;
		carried.rethrow();
	}

	if(outBuffer->getSize() != nInputEvents) {
		size_t nOutputEvents = outBuffer->getSize();
		delete outBuffer;
		char message[256];
		snprintf(message, sizeof(message), "stage produced %lu events from a block of %lu",
			(unsigned long)nOutputEvents, (unsigned long)nInputEvents);
		throw DERECO::Common::StructuralError(message);
	}

	this->sink->pushEvents(outBuffer);
}

template <class TEventInput, class TEventOutput>
void BlockEventHandler<TEventInput, TEventOutput>::discardWorkers()
{
	while(workers.size() > 0) {
		Worker *worker = workers.front();
		workers.pop_front();
		worker->wait();
		if(worker->error != NULL) {
			delete worker->error;
			delete worker->inBuffer;
		}
		else {
			delete worker->outBuffer;
		}
		delete worker;
	}
}

template <class TEventInput, class TEventOutput>
BlockEventHandler<TEventInput, TEventOutput>::Worker::Worker(
	BlockEventHandler<TEventInput, TEventOutput> *master, 
	EventBuffer<TEventInput> *inBuffer)
	: master(master), inBuffer(inBuffer), outBuffer(NULL), error(NULL),
	  runTime(0), runEvents(inBuffer->getSize())
{
}

template <class TEventInput, class TEventOutput>
void BlockEventHandler<TEventInput, TEventOutput>::Worker::run()
{
	struct timespec t0;
	clock_gettime(CLOCK_THREAD_CPUTIME_ID, &t0);
	
	try {
		outBuffer = master->handleEvents(inBuffer);
	}
	catch (DERECO::Common::Exception & e) {
		error = new DERECO::Common::ExceptionCarrier(e);
	}
	
	struct timespec t1;
	clock_gettime(CLOCK_THREAD_CPUTIME_ID, &t1);
	runTime = t1.tv_sec - t0.tv_sec + 1E-9*(t1.tv_nsec - t0.tv_nsec);
}
