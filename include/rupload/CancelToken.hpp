#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <functional>
#include <memory>
#include <vector>

namespace rupload {

class CancelToken : public std::enable_shared_from_this<CancelToken> {
public:
	CancelToken();
	CancelToken(const CancelToken&) = delete;

	// Cancel the operation if not finished already. Idempotent. Cancels all
	// unfinished children, then calls onCanceled.
	void cancel();

	// The operation completed on its own. Any later cancel() is a no-op.
	void finish();

	// Make a token for a sub-operation (for example one request of a chunked
	// transfer). It's canceled when this token is canceled; canceling it
	// doesn't affect this token.
	std::shared_ptr<CancelToken> makeChild();

	bool isCanceled() const; // True if canceled before finishing.
	bool isFinished() const; // True if finished or canceled.

	std::weak_ptr<CancelToken> parent;

	// Called at most once, on cancel. The in-flight operation uses this to
	// close its socket and unwind.
	std::function<void(void)> onCanceled;

protected:
	bool m_canceled;
	bool m_finished;
	std::vector<std::weak_ptr<CancelToken> > m_children;
};

} // namespace rupload
