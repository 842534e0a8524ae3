#include "element.hpp"

#include "logging.hpp"
#include "result_helper.hpp"

namespace host {

Element::Element(bilocator::TreeScope& scope, std::string label, Element* parent) :
    scope_(scope),
    label_(std::move(label)),
    parent_(parent)
{
}

Element::~Element()
{
    auto result = unmount();
    LOG_IF_ERR(result);
}

Element& Element::addChild(const std::string& label)
{
    children_.push_back(std::make_unique<Element>(scope_, label, this));
    return *children_.back();
}

void Element::markNeedsRebuild()
{
    dirty_ = true;
    ++rebuild_requests_;
    LOGT("{} marked for rebuild", describe());
}

std::string Element::describe() const
{
    std::string path = label_;
    for (const Element* element = parent_; element != nullptr; element = element->parent_) {
        path = element->label_ + "/" + path;
    }
    return path;
}

void Element::rebuild()
{
    dirty_ = false;
    if (on_build_) on_build_(*this);
}

Result<void> Element::unmount()
{
    if (!mounted_) return OK();

    Result<void> result = OK();
    for (auto& child : children_) {
        auto child_result = child->unmount();
        if (!child_result && result)
            result = child_result;
    }

    auto own = scope_.onUnmount(*this);
    if (!own && result)
        result = own;

    mounted_ = false;
    return result;
}

}; // namespace host
