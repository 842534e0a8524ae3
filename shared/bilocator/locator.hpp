#pragma once

#include "registry.hpp"
#include "tree_scope.hpp"
#include "binding_group.hpp"

namespace bilocator {

	// Owns the registry, the tree scope over it and the processed group keys.
	// Production code reaches the process instance through LocatorBuild();
	// tests construct their own.
	class Locator
	{
	public:
		inline static constexpr const char* LOG_TAG = "Locator";

		Locator() : scope_(registry_) {}
		~Locator() = default;

		Locator(const Locator&) = delete;
		Locator& operator=(const Locator&) = delete;

		Registry& registry() { return registry_; }
		TreeScope& scope() { return scope_; }
		GroupKeys& groupKeys() { return keys_; }

		const Registry& registry() const { return registry_; }

		// Tears down every tree binding, then empties the registry (disposing
		// what it still holds) and forgets the processed group keys.
		void reset();

		static Locator& instance();

	private:
		// declaration order is destruction order in reverse: scope before registry
		Registry registry_;
		TreeScope scope_;
		GroupKeys keys_;
	}; // class Locator


	// The process entry point.
	Locator& LocatorBuild();

}; // namespace bilocator
