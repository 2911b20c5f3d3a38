#include "HtmlDocument.hpp"

#include <lexbor/html/html.h>
#include <lexbor/dom/dom.h>

namespace lookup
{

namespace
{

class Collection
{
public:
    explicit Collection(lxb_dom_document_t* document)
        : collection_(lxb_dom_collection_make(document, 16))
    {
    }

    ~Collection()
    {
        if (collection_)
            lxb_dom_collection_destroy(collection_, true);
    }

    Collection(const Collection&) = delete;
    Collection& operator=(const Collection&) = delete;

    lxb_dom_collection_t* get() const { return collection_; }

    std::vector<lxb_dom_element_t*> elements() const
    {
        std::vector<lxb_dom_element_t*> out;
        if (!collection_)
            return out;
        const size_t count = lxb_dom_collection_length(collection_);
        out.reserve(count);
        for (size_t i = 0; i < count; ++i)
        {
            out.push_back(lxb_dom_collection_element(collection_, i));
        }
        return out;
    }

private:
    lxb_dom_collection_t* collection_;
};

std::string nodeText(lxb_dom_node_t* node)
{
    size_t len = 0;
    lxb_char_t* text = lxb_dom_node_text_content(node, &len);
    if (!text)
        return {};
    std::string out(reinterpret_cast<const char*>(text), len);
    lxb_dom_document_destroy_text(node->owner_document, text);
    return out;
}

} // namespace

struct HtmlDocument::Impl
{
    lxb_html_document_t* document = nullptr;

    ~Impl() { reset(); }

    void reset()
    {
        if (document)
        {
            lxb_html_document_destroy(document);
            document = nullptr;
        }
    }

    lxb_dom_document_t* dom() const { return &document->dom_document; }

    std::vector<lxb_dom_element_t*> byClass(const std::string& class_name) const
    {
        lxb_dom_element_t* root = lxb_dom_document_element(dom());
        if (!root)
            return {};

        Collection collection(dom());
        if (!collection.get())
            return {};

        const auto status = lxb_dom_elements_by_class_name(
            root, collection.get(), reinterpret_cast<const lxb_char_t*>(class_name.data()), class_name.size());
        if (status != LXB_STATUS_OK)
            return {};
        return collection.elements();
    }
};

HtmlDocument::HtmlDocument()
    : impl_(std::make_unique<Impl>())
{
}

HtmlDocument::~HtmlDocument() = default;

bool HtmlDocument::parse(const std::string& html)
{
    impl_->reset();
    last_error_.clear();

    impl_->document = lxb_html_document_create();
    if (!impl_->document)
    {
        last_error_ = "failed to allocate HTML document";
        return false;
    }

    const auto status = lxb_html_document_parse(impl_->document, reinterpret_cast<const lxb_char_t*>(html.data()),
                                                html.size());
    if (status != LXB_STATUS_OK)
    {
        impl_->reset();
        last_error_ = "failed to parse HTML (lexbor status " + std::to_string(status) + ")";
        return false;
    }
    return true;
}

bool HtmlDocument::isParsed() const { return impl_->document != nullptr; }

std::string HtmlDocument::textOfClass(const std::string& class_name) const
{
    if (!isParsed())
        return {};

    std::string text;
    for (auto* element : impl_->byClass(class_name))
    {
        text += nodeText(lxb_dom_interface_node(element));
    }
    return text;
}

std::vector<HtmlDocument::Row> HtmlDocument::rowsOfClass(const std::string& class_name) const
{
    std::vector<Row> rows;
    if (!isParsed())
        return rows;

    static const std::string tr = "tr";
    for (auto* container : impl_->byClass(class_name))
    {
        Collection collection(impl_->dom());
        if (!collection.get())
            continue;
        if (lxb_dom_elements_by_tag_name(container, collection.get(), reinterpret_cast<const lxb_char_t*>(tr.data()),
                                         tr.size()) != LXB_STATUS_OK)
            continue;

        for (auto* row_element : collection.elements())
        {
            Row row;
            auto* row_node = lxb_dom_interface_node(row_element);
            for (auto* child = lxb_dom_node_first_child(row_node); child; child = lxb_dom_node_next(child))
            {
                if (child->type == LXB_DOM_NODE_TYPE_ELEMENT)
                    row.push_back(nodeText(child));
            }
            rows.push_back(std::move(row));
        }
    }
    return rows;
}

} // namespace lookup
