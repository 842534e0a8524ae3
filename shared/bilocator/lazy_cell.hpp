#pragma once

#include <functional>
#include <memory>
#include <string>
#include <type_traits>

#include "result.h"
#include "result_helper.hpp"
#include "logging.hpp"
#include "basis_typeinfo.hpp"
#include "change_notifier.hpp"

namespace bilocator
{

    // Type-erased view of a LazyCell, what the Registry and TreeScope store.
    class ILazyCell
    {
    public:
        virtual ~ILazyCell() = default;

        // static type the cell was declared with
        virtual TypeId valueType() const = 0;

        // true once an instance exists, eagerly supplied or built
        virtual bool hasInstance() const = 0;

        // true once resolve() completed; a built instance has also passed the init hook
        virtual bool isResolved() const = 0;
        virtual bool isDisposed() const = 0;

        // Resolves and returns a pointer to the most-derived object, sharing ownership with the cell.
        virtual Result<std::shared_ptr<void>> resolveErased() = 0;

        // Observable capability of the current instance; null when there is no
        // instance yet or the instance is not a ChangeNotifier. Never builds.
        virtual std::shared_ptr<ChangeNotifier> notifier() const = 0;

        virtual void dispose() = 0;
    }; // interface ILazyCell


    // Deferred construction of a single T.
    // Holds either an eagerly supplied instance or a factory, never both.
    // The factory runs at most once, on the first resolve(), followed by the
    // init hook. The hook only sees instances the factory built; an eagerly
    // supplied instance never reaches it.
    // @tparam T Value type
    template<typename T>
    class LazyCell final : public ILazyCell
    {
    public:
        inline static constexpr const char* LOG_TAG = "LazyCell";

        using Factory = std::function<std::shared_ptr<T>()>;
        using InitHook = std::function<void(const std::shared_ptr<T>&)>;

        // InvalidArgument when both or neither of factory / instance are given.
        static Result<std::shared_ptr<LazyCell<T>>> create(Factory factory,
                                                           std::shared_ptr<T> instance,
                                                           InitHook init_hook = {})
        {
            using CellPtr = std::shared_ptr<LazyCell<T>>;
            const bool has_factory = static_cast<bool>(factory);
            const bool has_instance = instance != nullptr;
            if (has_factory == has_instance) {
                auto message = fmt::format(
                    "LazyCell<{}> needs exactly one of a factory or an instance, got {}",
                    getTypeId<T>().name(), has_factory ? "both" : "neither");
                LOG_WARN(LOG_TAG, "{}", message);
                return Result<CellPtr>::Error(ResultCode::InvalidArgument, message);
            }
            return Result<CellPtr>::OK(std::make_shared<LazyCell<T>>(
                PrivateTag{}, std::move(factory), std::move(instance), std::move(init_hook)));
        }

        static Result<std::shared_ptr<LazyCell<T>>> fromFactory(Factory factory, InitHook init_hook = {})
        {
            return create(std::move(factory), nullptr, std::move(init_hook));
        }

        static Result<std::shared_ptr<LazyCell<T>>> fromInstance(std::shared_ptr<T> instance, InitHook init_hook = {})
        {
            return create(nullptr, std::move(instance), std::move(init_hook));
        }

    private:
        struct PrivateTag { explicit PrivateTag() = default; };

    public:
        // use create(); public only for std::make_shared
        LazyCell(PrivateTag, Factory factory, std::shared_ptr<T> instance, InitHook init_hook) :
            type_(getTypeId<T>()),
            factory_(std::move(factory)),
            instance_(std::move(instance)),
            init_hook_(std::move(init_hook))
        {
        }

        ~LazyCell() override = default;

        [[nodiscard]] Result<std::shared_ptr<T>> resolve()
        {
            using Ptr = std::shared_ptr<T>;
            if (disposed_) {
                return Result<Ptr>::Error(ResultCode::InvalidState,
                    fmt::format("LazyCell<{}> was resolved after being disposed", type_.name()));
            }
            if (resolved_) {
                return Result<Ptr>::OK(instance_);
            }
            if (resolving_) {
                return Result<Ptr>::Error(ResultCode::InvalidState,
                    fmt::format("LazyCell<{}> was resolved again while it was being built "
                                "(circular dependency in its factory?)", type_.name()));
            }

            ResolvingGuard guard(resolving_);
            if (instance_) {
                // eager instance: nothing was built, so there is nothing to initialize
                init_hook_ = nullptr;
                resolved_ = true;
                return Result<Ptr>::OK(instance_);
            }

            auto built = factory_();
            if (!built) {
                return Result<Ptr>::Error(ResultCode::InvalidState,
                    fmt::format("factory of LazyCell<{}> returned null", type_.name()));
            }
            instance_ = std::move(built);
            factory_ = nullptr;
            LOGT("built instance of {}", type_.name());

            // resolved before the hook, so the hook may resolve this cell again
            resolved_ = true;
            if (init_hook_) {
                auto hook = std::move(init_hook_);
                init_hook_ = nullptr;
                hook(instance_);
            }
            return Result<Ptr>::OK(instance_);
        }

        TypeId valueType() const override { return type_; }
        bool hasInstance() const override { return instance_ != nullptr; }
        bool isResolved() const override { return resolved_; }
        bool isDisposed() const override { return disposed_; }

        Result<std::shared_ptr<void>> resolveErased() override
        {
            auto resolved = resolve();
            RETURN_IF_ERR_AS(resolved, std::shared_ptr<void>);
            const auto& instance = resolved.value();
            if constexpr (std::is_polymorphic_v<T>) {
                return Result<std::shared_ptr<void>>::OK(
                    std::shared_ptr<void>(instance, dynamic_cast<void*>(instance.get())));
            } else {
                return Result<std::shared_ptr<void>>::OK(std::static_pointer_cast<void>(instance));
            }
        }

        std::shared_ptr<ChangeNotifier> notifier() const override
        {
            if constexpr (std::is_polymorphic_v<T>) {
                return std::dynamic_pointer_cast<ChangeNotifier>(instance_);
            } else {
                return nullptr;
            }
        }

        // Disposes the instance at most once, and only if one exists.
        void dispose() override
        {
            if (disposed_) return;
            disposed_ = true;
            auto observable = notifier();
            if (observable) {
                observable->dispose();
                LOGD("disposed instance of {}", type_.name());
            }
            factory_ = nullptr;
            init_hook_ = nullptr;
        }

    private:
        struct ResolvingGuard {
            explicit ResolvingGuard(bool& flag) : flag_(flag) { flag_ = true; }
            ~ResolvingGuard() { flag_ = false; }
            bool& flag_;
        };

        TypeId type_;
        Factory factory_;
        std::shared_ptr<T> instance_;
        InitHook init_hook_;
        bool resolving_ = false;
        bool resolved_ = false;
        bool disposed_ = false;
    }; // class LazyCell


}; // namespace bilocator
