#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "result.h"
#include "tree_position.hpp"
#include "tree_scope.hpp"

namespace host {

	// Minimal element tree for driving the locator: each element owns its
	// children, counts rebuild requests and reports its unmount to the scope.
	class Element final : public bilocator::TreePosition
	{
	public:
		inline static constexpr const char* LOG_TAG = "Element";

		Element(bilocator::TreeScope& scope, std::string label, Element* parent = nullptr);
		~Element() override;

		Element(const Element&) = delete;
		Element& operator=(const Element&) = delete;

		Element& addChild(const std::string& label);

		bilocator::TreePosition* parentPosition() const override { return parent_; }
		void markNeedsRebuild() override;
		std::string describe() const override;

		// Clears the dirty flag and runs the build callback if set.
		void rebuild();

		// Unmounts the subtree, children first. Further calls are no-ops.
		Result<void> unmount();

		void setOnBuild(std::function<void(Element&)> on_build) { on_build_ = std::move(on_build); }

		bool isDirty() const { return dirty_; }
		int rebuildRequests() const { return rebuild_requests_; }
		bool isMounted() const { return mounted_; }
		const std::string& label() const { return label_; }
		size_t childCount() const { return children_.size(); }

	private:
		bilocator::TreeScope& scope_;
		std::string label_;
		Element* parent_;
		std::vector<std::unique_ptr<Element>> children_;
		std::function<void(Element&)> on_build_;

		bool dirty_ = false;
		bool mounted_ = true;
		int rebuild_requests_ = 0;
	}; // class Element

}; // namespace host
