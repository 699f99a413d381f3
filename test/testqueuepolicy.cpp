#include <cassert>
#include <cstdio>
#include <cstring>

#include "QueueHarness.hpp"

using namespace rupload;
using namespace rupload::test;

namespace {

// Claims more bytes than it can produce.
class TruncatedSource : public ByteSource {
public:
	TruncatedSource(uint64_t claimedSize, size_t actualSize) :
		m_claimedSize(claimedSize),
		m_bytes(patternBytes(actualSize))
	{}

	uint64_t size() const override { return m_claimedSize; }

	bool read(uint64_t offset, size_t len, uint8_t *dst) override
	{
		if(offset + len > m_bytes.size())
			return false;
		if(len)
			memcpy(dst, m_bytes.data() + offset, len);
		return true;
	}

protected:
	uint64_t m_claimedSize;
	Bytes    m_bytes;
};

UploadConfig smallChunks()
{
	UploadConfig rv;
	rv.chunkSize = KiB;
	rv.chunkThreshold = KiB;
	rv.retryBaseDelay = 0.01;
	return rv;
}

}

static void testBackoffAndRetryLimit()
{
	UploadConfig config;
	config.maxRetries = 3;
	config.retryBaseDelay = 0.02;
	QueueHarness h(config);

	assert(0.02 == h.manager.getRetryPolicy().backoffDelay(1));
	assert(0.08 == h.manager.getRetryPolicy().backoffDelay(3));

	bool healthy = false;
	h.client->responder = [&healthy] (const RecordedRequest &) {
		return healthy ? MockHttpClient::respond(200, { { "ok", true } }) : MockHttpClient::respond(503, { { "error", "unavailable" } });
	};

	std::string id = h.manager.add(patternSource(100), "small.txt");
	assert(h.runUntilStatus(id, TS_FAILED));

	TransferSnapshot snap = h.get(id);
	assert(3 == snap.retryCount);
	assert(4 == snap.attempts.size());
	assert(EK_SERVER_5XX == snap.lastError.kind);
	assert(snap.lastError.retryable);
	assert(not snap.retryScheduled);
	assert(4 == h.client->requests.size());

	Duration delay = 0.02;
	for(size_t x = 1; x < h.client->requests.size(); x++)
	{
		Duration gap = h.client->requests[x].sentAt - h.client->requests[x - 1].sentAt;
		printf("retry %lu after %.4Lf s\n", (unsigned long)x, gap);
		assert(gap >= delay - 0.001);
		delay *= 2;
	}

	const std::vector<TransferStatus> expectHistory = {
		TS_UPLOADING, TS_PENDING, TS_UPLOADING, TS_PENDING, TS_UPLOADING, TS_PENDING, TS_UPLOADING, TS_FAILED
	};
	assert(h.history[id] == expectHistory);

	// a manual retry starts the count over
	healthy = true;
	assert(h.manager.retry(id));
	snap = h.get(id);
	assert(TS_PENDING == snap.status);
	assert(0 == snap.retryCount);
	assert(snap.retryScheduled);
	assert(not snap.lastError.isError());
	assert(not h.manager.retry(id));

	assert(h.runUntilStatus(id, TS_SUCCESS));
	assert(5 == h.client->requests.size());
	assert(4 == h.get(id).attempts.size());
}

static void testAutoRetryDisabled()
{
	UploadConfig config;
	config.autoRetry = false;
	QueueHarness h(config);

	h.client->responder = [] (const RecordedRequest &) { return MockHttpClient::respondEmpty(500); };

	std::string id = h.manager.add(patternSource(100), "small.txt");
	assert(h.runUntilStatus(id, TS_FAILED));

	TransferSnapshot snap = h.get(id);
	assert(0 == snap.retryCount);
	assert(snap.lastError.retryable);
	assert(500 == snap.lastError.httpStatus);
	assert(snap.lastError.message == "Internal Server Error");
	assert(1 == h.client->requests.size());
}

static void testRemoveDuringBackoff()
{
	UploadConfig config;
	config.retryBaseDelay = 0.2;
	QueueHarness h(config);

	h.client->responder = [] (const RecordedRequest &) { return MockHttpClient::respondEmpty(503); };

	std::string id = h.manager.add(patternSource(100), "small.txt");
	assert(h.runUntil([&] { return h.get(id).retryScheduled; }));
	assert(TS_PENDING == h.status(id));

	assert(h.manager.remove(id));
	assert(0 == h.manager.size());
	TransferSnapshot snap;
	assert(not h.manager.getSnapshot(id, snap));
	assert(not h.manager.remove(id));

	h.rl.run(0.4);
	assert(1 == h.client->requests.size());
	assert(0 == h.manager.size());
}

static void testCancelDuringBackoff()
{
	UploadConfig config;
	config.retryBaseDelay = 0.2;
	QueueHarness h(config);

	h.client->responder = [] (const RecordedRequest &) { return MockHttpClient::respondEmpty(503); };

	std::string id = h.manager.add(patternSource(100), "small.txt");
	assert(h.runUntil([&] { return h.get(id).retryScheduled; }));

	assert(h.manager.cancel(id));
	TransferSnapshot snap = h.get(id);
	assert(TS_CANCELLED == snap.status);
	assert(not snap.retryScheduled);
	assert(1 == snap.attempts.size()); // nothing was in flight
	assert(0 == h.client->canceledCount);

	h.rl.run(0.4);
	assert(1 == h.client->requests.size());
	assert(TS_CANCELLED == h.status(id));
	assert(h.manager.cancel(id));
	assert(h.manager.isSettled());
}

static void testConcurrencyLimit()
{
	UploadConfig config;
	config.maxConcurrentUploads = 2;
	QueueHarness h(config);

	std::vector<UploadFile> files;
	for(unsigned x = 0; x < 5; x++)
	{
		UploadFile file;
		file.source = patternSource(KiB, x);
		file.name = "photo" + std::to_string(x) + ".jpg";
		files.push_back(file);
	}
	std::vector<std::string> ids = h.manager.addFiles(files);

	assert(2 == h.manager.countWithStatus(TS_UPLOADING));
	assert(3 == h.manager.countWithStatus(TS_PENDING));
	assert(not h.get(ids[2]).retryScheduled);
	assert(h.get(ids[4]).mimeType == "image/jpeg");
	assert(not h.manager.isSettled());

	assert(h.runUntilSettled());
	assert(2 == h.maxUploading);
	assert(5 == h.manager.countWithStatus(TS_SUCCESS));
	assert(5 == h.client->requests.size());
	for(size_t x = 0; x < 5; x++)
		assert(h.client->requests[x].field("fileId") == ids[x]); // started in insertion order
}

// With one slot, a resumed transfer waits its turn.
static void testResumeWaitsForSlot()
{
	UploadConfig config = smallChunks();
	config.maxConcurrentUploads = 1;
	QueueHarness h(config);

	std::string first = h.manager.add(patternSource(8 * KiB, 1), "first.bin");
	assert(h.runUntil([&] { return h.get(first).currentChunkIndex >= 2; }));
	assert(h.manager.pause(first));

	std::string second = h.manager.add(patternSource(4 * KiB, 2), "second.bin");
	assert(TS_UPLOADING == h.status(second));

	assert(h.manager.resume(first));
	assert(TS_PENDING == h.status(first));
	assert(not h.get(first).retryScheduled);

	assert(h.runUntilSettled());
	assert(TS_SUCCESS == h.status(first));
	assert(TS_SUCCESS == h.status(second));
	assert(1 == h.maxUploading);

	const std::vector<TransferStatus> expectHistory = { TS_UPLOADING, TS_PAUSED, TS_PENDING, TS_UPLOADING, TS_SUCCESS };
	assert(h.history[first] == expectHistory);

	// nothing of first's went out until second was finalized
	size_t secondDone = 0;
	for(size_t x = 0; x < h.client->requests.size(); x++)
		if(h.client->requests[x].request.target == "/finalize-upload" and QueueHarness::fileIdOf(h.client->requests[x]) == second)
			secondDone = x;
	for(size_t x = 0; x < secondDone; x++)
		if(QueueHarness::fileIdOf(h.client->requests[x]) == first)
			assert(h.client->requests[x].chunkIndex() <= 2);
}

// A retry whose backoff ends while the only slot is busy waits for the slot.
static void testRetryWaitsForSlot()
{
	UploadConfig config;
	config.maxConcurrentUploads = 1;
	config.retryBaseDelay = 0.001;
	QueueHarness h(config);
	h.client->latency = 0.05;

	bool failedOnce = false;
	h.client->responder = [&failedOnce] (const RecordedRequest &) {
		if(failedOnce)
			return MockHttpClient::respond(200, { { "ok", true } });
		failedOnce = true;
		return MockHttpClient::respondEmpty(503);
	};

	std::string a = h.manager.add(patternSource(100, 1), "a.txt");
	std::string b = h.manager.add(patternSource(100, 2), "b.txt");
	assert(TS_PENDING == h.status(b));

	bool sawWaiting = false;
	h.onNotify = [&] (const std::vector<TransferSnapshot> &snapshot) {
		for(auto it = snapshot.begin(); it != snapshot.end(); it++)
			if((it->id == a) and (TS_PENDING == it->status) and (not it->retryScheduled) and (1 == it->retryCount))
				sawWaiting = true;
	};

	assert(h.runUntilSettled());
	assert(sawWaiting);
	assert(TS_SUCCESS == h.status(a));
	assert(TS_SUCCESS == h.status(b));
	assert(1 == h.maxUploading);

	assert(3 == h.client->requests.size());
	assert(h.client->requests[0].field("fileId") == a);
	assert(h.client->requests[1].field("fileId") == b);
	assert(h.client->requests[2].field("fileId") == a);
}

static void testSourceErrors()
{
	UploadConfig config = smallChunks();
	config.chunkThreshold = 4 * KiB;
	QueueHarness h(config);

	std::string direct = h.manager.add(std::make_shared<TruncatedSource>(64, 0), "gone.txt");
	std::string chunked = h.manager.add(std::make_shared<TruncatedSource>(8 * KiB, 2 * KiB + 10), "short.bin");
	assert(TM_CHUNKED == h.get(chunked).mode);

	assert(h.runUntilSettled());

	TransferSnapshot d = h.get(direct);
	assert(TS_FAILED == d.status);
	assert(EK_SOURCE == d.lastError.kind);
	assert(not d.lastError.retryable);
	assert(0 == d.retryCount);

	TransferSnapshot c = h.get(chunked);
	assert(TS_FAILED == c.status);
	assert(EK_SOURCE == c.lastError.kind);
	assert(2 == c.lastError.chunkIndex);
	assert(2 == c.currentChunkIndex);
	assert(0 == c.retryCount);

	const std::vector<long> expectIndexes = { 0, 1 }; // chunk 2's body couldn't be produced
	assert(h.client->chunkIndexesFor(chunked) == expectIndexes);
	assert(4 == h.client->requests.size());
	assert(0 == h.client->requestsTo("/finalize-upload").size());

	assert(h.manager.add(std::shared_ptr<ByteSource>(), "nothing").empty());
}

static void testFinalizeRetry()
{
	QueueHarness h(smallChunks());

	size_t finalizeCount = 0;
	h.client->responder = [&finalizeCount] (const RecordedRequest &req) {
		if((req.request.target == "/finalize-upload") and (0 == finalizeCount++))
			return MockHttpClient::respond(500, { { "error", "assembly failed" } });
		return MockHttpClient::respond(200, { { "ok", true } });
	};

	std::string id = h.manager.add(patternSource(4 * KiB), "four.bin");
	assert(h.runUntilStatus(id, TS_SUCCESS));

	const std::vector<long> expectIndexes = { 0, 1, 2, 3 };
	assert(h.client->chunkIndexesFor(id) == expectIndexes); // no chunk re-sent
	assert(2 == h.client->requestsTo("/finalize-upload").size());

	TransferSnapshot snap = h.get(id);
	assert(1 == snap.retryCount);
	assert(1 == snap.attempts.size());
	assert(EK_FINALIZE == snap.attempts[0].kind);
	assert(500 == snap.attempts[0].httpStatus);
	assert(snap.attempts[0].message == "assembly failed");
	assert(snap.attempts[0].retryable);
}

static void testNetworkErrorRetry()
{
	UploadConfig config;
	config.retryBaseDelay = 0.01;
	QueueHarness h(config);

	bool failedOnce = false;
	h.client->responder = [&failedOnce] (const RecordedRequest &) {
		if(failedOnce)
			return MockHttpClient::respond(201, { { "id", 7 } });
		failedOnce = true;
		return MockHttpClient::networkFailure("connection refused");
	};

	std::string id = h.manager.add(patternSource(300), "notes.txt", "text/x-notes");
	assert(h.runUntilStatus(id, TS_SUCCESS));

	TransferSnapshot snap = h.get(id);
	assert(snap.mimeType == "text/x-notes");
	assert(1 == snap.retryCount);
	assert(EK_NETWORK == snap.attempts[0].kind);
	assert(0 == snap.attempts[0].httpStatus);
	assert(snap.attempts[0].message == "connection refused");
	assert(snap.result["id"] == 7);
	assert(2 == h.client->requests.size());
	assert(h.client->requests[1].part("file")->contentType == "text/x-notes");
}

static void testExtraHeadersAndFields()
{
	UploadConfig config = smallChunks();
	config.extraHeaders.push_back(std::make_pair("Authorization", "Bearer t0k3n"));
	config.extraFields.push_back(std::make_pair("folder", "inbox"));
	QueueHarness h(config);

	h.manager.add(patternSource(3 * KiB), "three.bin");
	h.manager.add(patternSource(512), "half.bin");
	assert(h.runUntilSettled());
	assert(2 == h.manager.countWithStatus(TS_SUCCESS));

	assert(5 == h.client->requests.size());
	for(auto it = h.client->requests.begin(); it != h.client->requests.end(); it++)
	{
		assert(it->request.getHeader("authorization") == "Bearer t0k3n");
		if(it->request.target != "/finalize-upload")
			assert(it->field("folder") == "inbox");
	}

	auto chunk = h.client->requestsTo("/upload-chunk").at(0);
	const char *chunkOrder[] = { "chunk", "chunkIndex", "totalChunks", "fileName", "fileId", "folder" };
	assert(6 == chunk.parts.size());
	for(size_t x = 0; x < chunk.parts.size(); x++)
		assert(chunk.parts[x].name == chunkOrder[x]);
	assert(chunk.part("chunk")->filename == "three.bin");

	auto upload = h.client->requestsTo("/upload").at(0);
	const char *uploadOrder[] = { "file", "fileId", "fileName", "folder" };
	assert(4 == upload.parts.size());
	for(size_t x = 0; x < upload.parts.size(); x++)
		assert(upload.parts[x].name == uploadOrder[x]);
}

static void testPauseUnsupported()
{
	UploadConfig config = smallChunks();
	config.pauseResumeSupported = false;
	QueueHarness h(config);

	std::string id = h.manager.add(patternSource(4 * KiB), "four.bin");
	assert(not h.manager.pause(id));
	assert(TS_UPLOADING == h.status(id));
	assert(h.runUntilStatus(id, TS_SUCCESS));
	assert(0 == h.client->canceledCount);
}

static void testEmptyFile()
{
	QueueHarness h(smallChunks());

	std::string id = h.manager.add(std::make_shared<MemoryByteSource>(Bytes()), "empty.txt");
	assert(TM_DIRECT == h.get(id).mode);
	assert(h.runUntilStatus(id, TS_SUCCESS));
	assert(100 == h.get(id).progress);
	assert(1 == h.client->requests.size());
	assert(h.client->requests[0].part("file")->value.empty());
}

// The observer may act on the manager from inside a notification.
static void testObserverReentrancy()
{
	QueueHarness h(smallChunks());

	bool paused = false;
	h.onNotify = [&] (const std::vector<TransferSnapshot> &snapshot) {
		for(auto it = snapshot.begin(); it != snapshot.end(); it++)
			if((TS_UPLOADING == it->status) and not paused)
			{
				paused = true;
				assert(h.manager.pause(it->id));
			}
	};

	std::string id = h.manager.add(patternSource(4 * KiB), "four.bin");
	h.onNotify = nullptr;

	assert(paused);
	assert(TS_PAUSED == h.status(id));
	assert(0 == h.client->requests.size());
	assert(EK_CANCELLED == h.get(id).attempts.at(0).kind);

	assert(h.manager.resume(id));
	assert(h.runUntilStatus(id, TS_SUCCESS));
	assert(5 == h.client->requests.size());
}

static void testClose()
{
	QueueHarness h(smallChunks());

	std::string a = h.manager.add(patternSource(4 * KiB), "a.bin");
	std::string b = h.manager.add(patternSource(100), "b.txt");
	assert(2 == h.client->inFlight);

	h.manager.close();
	assert(2 == h.client->canceledCount);
	assert(0 == h.client->inFlight);
	assert(TS_UPLOADING == h.status(a));
	assert(TS_UPLOADING == h.status(b));

	assert(h.manager.add(patternSource(10), "late.txt").empty());
	assert(0 == h.manager.retryAll());

	h.rl.run(0.05);
	assert(2 == h.client->requests.size());
	assert(TS_UPLOADING == h.status(a));

	assert(h.manager.cancel(b));
	assert(TS_CANCELLED == h.status(b));
}

int main(int argc, char *argv[])
{
	testBackoffAndRetryLimit();
	testAutoRetryDisabled();
	testRemoveDuringBackoff();
	testCancelDuringBackoff();
	testConcurrencyLimit();
	testResumeWaitsForSlot();
	testRetryWaitsForSlot();
	testSourceErrors();
	testFinalizeRetry();
	testNetworkErrorRetry();
	testExtraHeadersAndFields();
	testPauseUnsupported();
	testEmptyFile();
	testObserverReentrancy();
	testClose();

	printf("end.\n");
	return 0;
}
