#include <cassert>
#include <cstdio>

#include "rupload/RetryPolicy.hpp"

using namespace rupload;

static void checkClassify(int status, bool isFinalize, ErrorKind expectedKind, bool expectedRetryable)
{
	UploadError error = RetryPolicy::classifyStatus(status, "", isFinalize);
	printf("status %d%s -> %s\n", status, isFinalize ? " (finalize)" : "", error.describe().c_str());
	assert(error.kind == expectedKind);
	assert(error.retryable == expectedRetryable);
	assert(error.httpStatus == status);
	assert(not error.message.empty());
}

int main(int argc, char *argv[])
{
	checkClassify(500, false, EK_SERVER_5XX, true);
	checkClassify(503, false, EK_SERVER_5XX, true);
	checkClassify(400, false, EK_VALIDATION_4XX, false);
	checkClassify(413, false, EK_VALIDATION_4XX, false);
	checkClassify(302, false, EK_VALIDATION_4XX, false); // any other non-2xx
	checkClassify(400, true, EK_FINALIZE, true);
	checkClassify(500, true, EK_FINALIZE, true);

	UploadError withMessage = RetryPolicy::classifyStatus(422, "file type not allowed");
	assert(withMessage.message == "file type not allowed");
	assert(RetryPolicy::classifyStatus(400, "").message == "Upload failed");
	assert(RetryPolicy::classifyStatus(400, "", true).message == "Failed to finalize upload");

	assert(RetryPolicy::networkError("connection reset").retryable);
	assert(EK_NETWORK == RetryPolicy::networkError("").kind);
	assert(not RetryPolicy::networkError("").message.empty());
	assert(not RetryPolicy::cancelledError().retryable);
	assert(EK_CANCELLED == RetryPolicy::cancelledError().kind);
	assert(not RetryPolicy::sourceError("gone").retryable);

	assert(not UploadError().isError());
	assert(UploadError().chunkIndex < 0);
	assert(std::string("ServerError5xx") == errorKindName(EK_SERVER_5XX));
	assert(std::string("NetworkError") == errorKindName(EK_NETWORK));

	RetryPolicy policy; // defaults: 3 retries, 1 s base, automatic
	assert(3 == policy.maxRetries);
	assert(1.0 == policy.baseDelay);
	assert(policy.autoRetry);

	assert(0 == policy.backoffDelay(0));
	assert(1.0 == policy.backoffDelay(1));
	assert(2.0 == policy.backoffDelay(2));
	assert(4.0 == policy.backoffDelay(3));
	assert(8.0 == policy.backoffDelay(4));

	UploadError net = RetryPolicy::networkError("timeout");
	assert(policy.shouldAutoRetry(net, 0));
	assert(policy.shouldAutoRetry(net, 2));
	assert(not policy.shouldAutoRetry(net, 3));
	assert(not policy.shouldAutoRetry(RetryPolicy::classifyStatus(400, ""), 0));
	assert(not policy.shouldAutoRetry(RetryPolicy::cancelledError(), 0));

	// retryCount never exceeds maxRetries when it's only incremented on an approved retry
	int retryCount = 0;
	while(policy.shouldAutoRetry(net, retryCount))
		retryCount++;
	assert(retryCount == policy.maxRetries);

	RetryPolicy capped(5, 0.5, true, 3.0);
	assert(0.5 == capped.backoffDelay(1));
	assert(2.0 == capped.backoffDelay(3));
	assert(3.0 == capped.backoffDelay(4));
	assert(3.0 == capped.backoffDelay(10));

	RetryPolicy manualOnly(3, 1.0, false);
	assert(not manualOnly.shouldAutoRetry(net, 0));

	RetryPolicy never(0);
	assert(not never.shouldAutoRetry(net, 0));

	printf("end.\n");
	return 0;
}
