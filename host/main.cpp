#include <memory>
#include <string>

#include <yaml-cpp/yaml.h>

#include "logging.hpp"
#include "bilocator.hpp"
#include "tree/element.hpp"

using namespace bilocator;
using host::Element;

static constexpr const char* TAG = "Demo";

namespace {

class Counter : public ChangeNotifier
{
public:
    int count() const { return count_; }
    void increment()
    {
        ++count_;
        notifyListeners();
    }

private:
    int count_ = 0;
};

class Settings
{
public:
    explicit Settings(std::string theme) : theme_(std::move(theme)) {}
    const std::string& theme() const { return theme_; }

private:
    std::string theme_;
};

class PageModel : public ValueNotifier<std::string>
{
public:
    PageModel() : ValueNotifier<std::string>("home") {}
};

} // namespace

int main(int argc, char* argv[])
{
    const std::string config = argc > 1 ? argv[1] : "config/logging.yaml";
    auto initialized = logging::init(logging::Type::SpdLog, config);
    if (!initialized) {
        // fall back to plain console output
        auto console = logging::Logger::instance().init(logging::Type::Console);
        if (!console) return 1;
        LOG_WARN(TAG, "logging config {} not applied: {}", config, initialized.c_str());
    }

    LOG_INFO(TAG, "locator demo start");
    Locator& locator = LocatorBuild();

    {
        Element root(locator.scope(), "app");
        Element& page = root.addChild("page");
        Element& header = page.addChild("header");

        // process-wide services, registered once for the app element
        BindingGroup services(locator.registry(), locator.groupKeys(), {
            lazyDelegate<Settings>([] { return std::make_shared<Settings>("dark"); }),
            instanceDelegate<Counter>(std::make_shared<Counter>(), Name("clicks")),
        }, std::string("app-services"));
        auto mounted = services.mount();
        if (!mounted) {
            LOG_ERROR(TAG, "service group failed: {}", mounted.c_str());
            return 1;
        }

        // a page-scoped model, visible only below the page element
        Bilocator<PageModel> page_model(locator.scope(), BindingSpec<PageModel>{
            [] { return std::make_shared<PageModel>(); }, nullptr, std::nullopt, Location::Tree});
        auto bound = page_model.mount(page);
        if (!bound) {
            LOG_ERROR(TAG, "page model bind failed: {}", bound.c_str());
            return 1;
        }

        auto settings = get<Settings>();
        if (settings) {
            LOG_INFO(TAG, "theme: {}", settings.value()->theme());
        }

        Observer observer(locator);
        auto clicks = observer.listenTo<Counter>(makeListener([] {
            LOG_INFO(TAG, "clicks changed");
        }), Name("clicks"));
        if (clicks) {
            clicks.value()->increment();
            clicks.value()->increment();
            LOG_INFO(TAG, "clicks: {}", clicks.value()->count());
        }

        auto model = locator.scope().resolveReactive<PageModel>(header);
        if (model) {
            model.value()->setValue("settings");
            LOG_INFO(TAG, "header rebuild requests: {}, page: {}", header.rebuildRequests(), page.rebuildRequests());
        }

        auto promoted = observer.promote<PageModel>(header, Name("current-page"));
        LOG_INFO(TAG, "page model promoted: {}", to_string(promoted.code()));
        LOG_INFO(TAG, "registry:\n{}", YAML::Dump(locator.registry().snapshot()));

        auto demoted = observer.demote<PageModel>(header);
        LOG_INFO(TAG, "page model demoted: {}", to_string(demoted.code()));

        observer.cancelSubscriptions();
        auto unmounted = root.unmount();
        if (!unmounted) {
            LOG_WARN(TAG, "unmount reported: {}", unmounted.c_str());
        }
    }

    locator.reset();
    LOG_INFO(TAG, "locator demo end");
    return 0;
}
