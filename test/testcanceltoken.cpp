#include <cassert>
#include <cstdio>

#include "rupload/CancelToken.hpp"

using namespace rupload;

int main(int argc, char *argv[])
{
	int canceledCount = 0;
	int childCanceledCount = 0;

	auto token = std::make_shared<CancelToken>();
	token->onCanceled = [&] { canceledCount++; };
	assert(not token->isCanceled());
	assert(not token->isFinished());

	auto child = token->makeChild();
	child->onCanceled = [&] { childCanceledCount++; };
	assert(child->parent.lock() == token);

	token->cancel();
	assert(token->isCanceled());
	assert(token->isFinished());
	assert(child->isCanceled());
	assert(1 == canceledCount);
	assert(1 == childCanceledCount);

	token->cancel(); // idempotent
	child->cancel();
	assert(1 == canceledCount);
	assert(1 == childCanceledCount);

	// a child of a canceled token starts out canceled
	auto late = token->makeChild();
	assert(late->isCanceled());

	// finishing means cancel does nothing
	auto finished = std::make_shared<CancelToken>();
	finished->onCanceled = [&] { canceledCount++; };
	finished->finish();
	finished->cancel();
	assert(not finished->isCanceled());
	assert(finished->isFinished());
	assert(1 == canceledCount);

	// canceling a child doesn't affect the parent or its siblings
	auto parent = std::make_shared<CancelToken>();
	auto a = parent->makeChild();
	auto b = parent->makeChild();
	a->cancel();
	assert(a->isCanceled());
	assert(not parent->isFinished());
	assert(not b->isFinished());

	// a finished child isn't canceled with its parent
	b->finish();
	auto c = parent->makeChild();
	parent->cancel();
	assert(not b->isCanceled());
	assert(c->isCanceled());

	// onCanceled may drop the last reference to the token
	auto selfish = std::make_shared<CancelToken>();
	std::shared_ptr<CancelToken> holder = selfish;
	selfish->onCanceled = [&holder] { holder.reset(); };
	selfish.reset();
	holder->cancel();
	assert(not holder);

	printf("end.\n");

	return 0;
}
