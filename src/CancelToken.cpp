// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <algorithm>

#include "../include/rupload/CancelToken.hpp"

namespace rupload {

CancelToken::CancelToken() :
	m_canceled(false),
	m_finished(false)
{
}

void CancelToken::cancel()
{
	if(m_finished)
		return;

	auto myself = shared_from_this();

	m_canceled = true;
	m_finished = true;

	std::vector<std::weak_ptr<CancelToken> > children;
	swap(children, m_children);
	for(auto it = children.begin(); it != children.end(); it++)
	{
		auto child = it->lock();
		if(child)
			child->cancel();
	}

	std::function<void(void)> onCanceled_f;
	swap(onCanceled_f, onCanceled);
	if(onCanceled_f)
		onCanceled_f();
}

void CancelToken::finish()
{
	if(m_finished)
		return;

	m_finished = true;
	onCanceled = nullptr;
	m_children.clear();
}

std::shared_ptr<CancelToken> CancelToken::makeChild()
{
	auto rv = std::make_shared<CancelToken>();
	rv->parent = shared_from_this();

	if(m_canceled)
		rv->cancel();
	else if(not m_finished)
	{
		m_children.erase(std::remove_if(m_children.begin(), m_children.end(),
			[] (const std::weak_ptr<CancelToken> &each) {
				auto child = each.lock();
				return (not child) or child->isFinished();
			}), m_children.end());
		m_children.push_back(rv);
	}

	return rv;
}

bool CancelToken::isCanceled() const
{
	return m_canceled;
}

bool CancelToken::isFinished() const
{
	return m_finished;
}

} // namespace rupload
