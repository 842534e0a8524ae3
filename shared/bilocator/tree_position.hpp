#pragma once

#include <string>

namespace bilocator {

	// A position in the host's tree, implemented by the host's node type.
	// The locator never owns positions; the host keeps each one alive until
	// it has reported the unmount (TreeScope::onUnmount).
	class TreePosition
	{
	public:
		virtual ~TreePosition() = default;

		// nullptr at the root
		virtual TreePosition* parentPosition() const = 0;

		// Schedules re-evaluation of this position. Called synchronously from
		// change notifications; the host decides when the rebuild happens.
		virtual void markNeedsRebuild() = 0;

		// label used in diagnostics
		virtual std::string describe() const = 0;
	}; // class TreePosition

}; // namespace bilocator
