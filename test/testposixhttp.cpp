#include <cassert>
#include <cstdio>

#include "rupload/FormData.hpp"
#include "rupload/PosixHttpClient.hpp"
#include "rupload/PosixHttpServer.hpp"
#include "rupload/SelectRunLoop.hpp"

using namespace rupload;
using namespace rupload::http;

namespace {

struct Tracked {
	int      completions { 0 };
	Result   result;
	uint64_t lastSent { 0 };
	uint64_t total { 0 };
	size_t   progressCalls { 0 };
	Time     completedAt { 0 };
};

std::shared_ptr<Tracked> sendTracked(SelectRunLoop &rl, IHttpClient &client, const Request &request, std::shared_ptr<CancelToken> token)
{
	auto rv = std::make_shared<Tracked>();
	client.send(request, token,
		[rv] (uint64_t bytesSent, uint64_t bodySize) {
			assert(bytesSent >= rv->lastSent);
			assert(bytesSent <= bodySize);
			rv->lastSent = bytesSent;
			rv->total = bodySize;
			rv->progressCalls++;
		},
		[rv, &rl] (const Result &result) {
			rv->completions++;
			rv->result = result;
			rv->completedAt = rl.getCurrentTime();
		});
	assert(0 == rv->completions); // never from within send()
	return rv;
}

bool runUntil(SelectRunLoop &rl, const std::function<bool(void)> &done, Duration limit = 10)
{
	if(done())
		return true;
	rl.onEveryCycle = [&rl, &done] { if(done()) rl.stop(); };
	rl.run(limit);
	rl.onEveryCycle = nullptr;
	return done();
}

std::string baseFor(int port)
{
	return "http://127.0.0.1:" + std::to_string(port) + "/api/";
}

Bytes patternBytes(size_t len)
{
	Bytes rv(len);
	for(size_t x = 0; x < len; x++)
		rv[x] = (uint8_t)(x * 7 + (x >> 8));
	return rv;
}

}

static void testMultipartExchange(SelectRunLoop &rl, PosixHttpServer &server)
{
	int port = server.getPort();
	Request seen;
	FormData::PartList seenParts;
	server.onRequest = [&] (const Request &request, const PosixHttpServer::respond_f &respond) {
		seen = request;
		Bytes body;
		assert(flattenBody(request.body, body));
		assert(FormData::parse(body, FormData::boundaryFromContentType(request.getHeader("Content-Type")), seenParts));
		respond(Response::json(200, { { "received", body.size() } }));
	};

	PosixHttpClient client(&rl, baseFor(port));
	client.writeSizePerSelect = 16384;
	assert(client.getBaseURI() == baseFor(port));
	assert(client.resolve("upload-chunk") == baseFor(port) + "upload-chunk");
	assert(client.resolve("/upload") == "http://127.0.0.1:" + std::to_string(port) + "/upload");

	auto source = std::make_shared<MemoryByteSource>(patternBytes(300000));
	FormData form;
	form.append("file", "photo.jpg", "image/jpeg", source, 1000, 250000);
	form.append("fileId", "upload_0123456789abcdef");

	Request request;
	request.target = "upload"; // relative to the base
	request.setHeader("Content-Type", form.contentType());
	request.setHeader("X-Upload-Token", "abc");
	request.body = form.encode();

	auto token = std::make_shared<CancelToken>();
	auto tracked = sendTracked(rl, client, request, token);
	assert(runUntil(rl, [&] { return tracked->completions > 0; }));

	assert(1 == tracked->completions);
	assert(tracked->result.hasResponse());
	assert(200 == tracked->result.response.status);
	assert(tracked->result.response.getHeader("Content-Type") == "application/json");
	assert(tracked->result.response.bodyJSON()["received"] == form.encodedSize());
	assert(tracked->total == form.encodedSize());
	assert(tracked->lastSent == tracked->total);
	assert(tracked->progressCalls > 1);
	assert(token->isFinished());
	assert(not token->isCanceled());

	assert(seen.method == "POST");
	assert(seen.target == "/api/upload");
	assert(seen.getHeader("Host") == "127.0.0.1:" + std::to_string(port));
	assert(seen.getHeader("X-Upload-Token") == "abc");
	assert(seen.getHeader("Connection") == "close");
	assert(seen.getHeader("Content-Length") == std::to_string(form.encodedSize()));

	assert(2 == seenParts.size());
	assert(seenParts[0].filename == "photo.jpg");
	assert(seenParts[0].contentType == "image/jpeg");
	assert(seenParts[0].value == Bytes(source->bytes().begin() + 1000, source->bytes().begin() + 251000));
	assert(seenParts[1].text() == "upload_0123456789abcdef");

	assert(runUntil(rl, [&] { return 0 == server.numConnections(); }));
}

static void testErrorResponse(SelectRunLoop &rl, PosixHttpServer &server)
{
	server.onRequest = [] (const Request &request, const PosixHttpServer::respond_f &respond) {
		nlohmann::json body = nlohmann::json::parse(request.body.at(0).bytes.begin(), request.body.at(0).bytes.end(), nullptr, false);
		assert(body["fileId"] == "upload_x");
		respond(Response::json(422, { { "error", "Missing chunks" } }));
	};

	PosixHttpClient client(&rl, baseFor(server.getPort()));
	auto token = std::make_shared<CancelToken>();
	auto tracked = sendTracked(rl, client, Request::json("/finalize-upload", { { "fileId", "upload_x" } }), token);
	assert(runUntil(rl, [&] { return tracked->completions > 0; }));

	assert(tracked->result.hasResponse());
	assert(422 == tracked->result.response.status);
	assert(not tracked->result.response.isSuccess());
	assert(tracked->result.response.errorMessage() == "Missing chunks");
}

static void testTimeout(SelectRunLoop &rl, PosixHttpServer &server)
{
	PosixHttpServer::respond_f deferred;
	server.onRequest = [&deferred] (const Request &request, const PosixHttpServer::respond_f &respond) {
		deferred = respond; // never answered in time
	};

	PosixHttpClient client(&rl, baseFor(server.getPort()));
	client.requestTimeout = 0.2;

	auto token = std::make_shared<CancelToken>();
	Time started = rl.getCurrentTimeNoCache();
	auto tracked = sendTracked(rl, client, Request::json("/upload", { { "x", 1 } }), token);
	assert(runUntil(rl, [&] { return tracked->completions > 0; }));

	assert(Result::TIMEOUT == tracked->result.outcome);
	assert(not tracked->result.hasResponse());
	assert(tracked->completedAt - started >= 0.2);
	assert(deferred);

	// answering after the client gave up goes nowhere
	assert(runUntil(rl, [&] { return 0 == server.numConnections(); }));
	deferred(Response::json(200, { { "late", true } }));
	rl.run(0.05);
	assert(1 == tracked->completions);
}

static void testDroppedConnection(SelectRunLoop &rl, PosixHttpServer &server)
{
	server.onRequest = [] (const Request &request, const PosixHttpServer::respond_f &respond) {
		respond(Response()); // hang up
	};

	PosixHttpClient client(&rl, baseFor(server.getPort()));
	auto tracked = sendTracked(rl, client, Request::json("/upload", { { "x", 1 } }), std::make_shared<CancelToken>());
	assert(runUntil(rl, [&] { return tracked->completions > 0; }));

	assert(Result::NETWORK_ERROR == tracked->result.outcome);
	printf("dropped connection: %s\n", tracked->result.reason.c_str());
}

static void testCancel(SelectRunLoop &rl, PosixHttpServer &server)
{
	bool requestSeen = false;
	server.onRequest = [&requestSeen] (const Request &request, const PosixHttpServer::respond_f &respond) {
		requestSeen = true;
	};

	PosixHttpClient client(&rl, baseFor(server.getPort()));
	auto token = std::make_shared<CancelToken>();
	auto tracked = sendTracked(rl, client, Request::json("/upload", { { "x", 1 } }), token);
	assert(runUntil(rl, [&] { return requestSeen; }));

	token->cancel();
	assert(token->isCanceled());
	rl.run(0.05);
	assert(0 == tracked->completions);
	assert(runUntil(rl, [&] { return 0 == server.numConnections(); }));

	// canceled before the connection is even up
	auto early = std::make_shared<CancelToken>();
	auto earlyTracked = sendTracked(rl, client, Request::json("/upload", { { "x", 2 } }), early);
	early->cancel();
	rl.run(0.05);
	assert(0 == earlyTracked->completions);

	// an already-finished token sends nothing
	auto done = std::make_shared<CancelToken>();
	done->finish();
	requestSeen = false;
	auto doneTracked = sendTracked(rl, client, Request::json("/upload", { { "x", 3 } }), done);
	rl.run(0.05);
	assert(0 == doneTracked->completions);
	assert(not requestSeen);
}

static void testBodySourceError(SelectRunLoop &rl, PosixHttpServer &server)
{
	server.onRequest = [] (const Request &request, const PosixHttpServer::respond_f &respond) {
		respond(Response::json(200, { { "unexpected", true } }));
	};

	PosixHttpClient client(&rl, baseFor(server.getPort()));
	auto source = std::make_shared<MemoryByteSource>(std::string("short"));
	Request request;
	request.target = "/upload";
	request.body.push_back(BodySegment(source, 0, 1000)); // past the end of the source

	auto tracked = sendTracked(rl, client, request, std::make_shared<CancelToken>());
	assert(runUntil(rl, [&] { return tracked->completions > 0; }));
	assert(Result::BODY_ERROR == tracked->result.outcome);
}

static void testConnectFailures(SelectRunLoop &rl, int closedPort)
{
	PosixHttpClient refused(&rl, baseFor(closedPort));
	auto tracked = sendTracked(rl, refused, Request::json("/upload", { { "x", 1 } }), std::make_shared<CancelToken>());
	assert(runUntil(rl, [&] { return tracked->completions > 0; }));
	assert(Result::NETWORK_ERROR == tracked->result.outcome);
	printf("refused: %s\n", tracked->result.reason.c_str());

	PosixHttpClient tls(&rl, "https://127.0.0.1/");
	auto tlsTracked = sendTracked(rl, tls, Request::json("/upload", { { "x", 1 } }), std::make_shared<CancelToken>());
	assert(runUntil(rl, [&] { return tlsTracked->completions > 0; }));
	assert(Result::NETWORK_ERROR == tlsTracked->result.outcome);
	assert(tlsTracked->result.reason == "unsupported scheme: https");
}

int main(int argc, char *argv[])
{
	SelectRunLoop rl;
	PosixHttpServer server(&rl);
	assert(server.listen("127.0.0.1", "0"));
	assert(server.getPort() > 0);
	assert(not server.listen("127.0.0.1", "0")); // already listening
	printf("listening on port %d\n", server.getPort());

	testMultipartExchange(rl, server);
	testErrorResponse(rl, server);
	testTimeout(rl, server);
	testDroppedConnection(rl, server);
	testCancel(rl, server);
	testBodySourceError(rl, server);

	int port = server.getPort();
	server.close();
	testConnectFailures(rl, port);

	printf("end.\n");
	return 0;
}
