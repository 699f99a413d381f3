#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <map>

#include "RunLoop.hpp"

namespace rupload {

class SelectRunLoop : public RunLoop {
public:
	using RunLoop::RunLoop;

	void registerDescriptor(int fd, Condition cond, const Action &action) override;
	void unregisterDescriptor(int fd, Condition cond) override;
	using RunLoop::registerDescriptor;
	using RunLoop::unregisterDescriptor;

	void run(Duration runInterval = INFINITY) override;

	void clear() override;

	size_t numDescriptors(Condition cond) const;

	struct Item;

protected:
	std::map<int, std::shared_ptr<Item> > m_items[NUM_CONDITIONS];
};

} // namespace rupload
