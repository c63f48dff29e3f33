// htmx_lsp/lsp/knowledge_base.cpp - htmx attribute and value documentation
#include "htmx_lsp/lsp/knowledge_base.hpp"

#include <utility>

namespace htmx_lsp::lsp
{

namespace
{

std::vector<KnowledgeEntry> builtin_attributes()
{
  return {
    {"hx-get", "Issues a `GET` to the specified URL.\n\n```html\n<button hx-get=\"/example\">Get Some HTML</button>\n```"},
    {"hx-post", "Issues a `POST` to the specified URL.\n\n```html\n<button hx-post=\"/account/enable\" hx-target=\"body\">Enable Your Account</button>\n```"},
    {"hx-put", "Issues a `PUT` to the specified URL."},
    {"hx-patch", "Issues a `PATCH` to the specified URL."},
    {"hx-delete", "Issues a `DELETE` to the specified URL."},
    {"hx-trigger", "Specifies the event that triggers the request.\n\nStandard events (`click`, `change`, `submit`), `load`, `revealed`, `intersect` and polling with `every <time>` are supported, with modifiers such as `once`, `changed`, `delay:<time>` and `throttle:<time>`."},
    {"hx-target", "Specifies the target element to be swapped.\n\nA CSS selector, `this`, or an extended selector: `closest <sel>`, `find <sel>`, `next <sel>`, `previous <sel>`."},
    {"hx-swap", "Controls how content is swapped in (`outerHTML`, `beforeend`, `afterend`, ...).\n\nDefaults to `innerHTML`. Modifiers: `swap:<time>`, `settle:<time>`, `scroll:<top|bottom>`, `show:<top|bottom>`, `focus-scroll:<bool>`, `transition:<bool>`."},
    {"hx-swap-oob", "Marks element to swap in from a response (out of band)."},
    {"hx-select", "Selects content to swap in from a response."},
    {"hx-select-oob", "Selects content to swap in from a response, somewhere other than the target (out of band)."},
    {"hx-boost", "Adds progressive enhancement for links and forms: they issue AJAX requests and swap the `body`."},
    {"hx-push-url", "Pushes a URL into the browser location bar to create history (`true`, `false` or a URL)."},
    {"hx-replace-url", "Replaces the URL in the browser location bar (`true`, `false` or a URL)."},
    {"hx-confirm", "Shows a `confirm()` dialog before issuing a request."},
    {"hx-disable", "Disables htmx processing for the given node and any children nodes."},
    {"hx-disabled-elt", "Adds the `disabled` attribute to the specified elements while a request is in flight."},
    {"hx-disinherit", "Controls and disables automatic attribute inheritance for child nodes."},
    {"hx-encoding", "Changes the request encoding type (`multipart/form-data` for file uploads)."},
    {"hx-ext", "Extensions to use for this element."},
    {"hx-headers", "Adds to the headers that will be submitted with the request (JSON)."},
    {"hx-history", "Prevents sensitive data being saved to the history cache (`false`)."},
    {"hx-history-elt", "The element to snapshot and restore during history navigation."},
    {"hx-include", "Includes additional data in requests (CSS selector)."},
    {"hx-indicator", "The element to put the `htmx-request` class on during the request."},
    {"hx-inherit", "Controls and enables automatic attribute inheritance for child nodes."},
    {"hx-on", "Handles events with inline scripts on elements (`hx-on:<event>`)."},
    {"hx-params", "Filters the parameters that will be submitted with a request (`*`, `none`, `not <list>`, `<list>`)."},
    {"hx-preserve", "Specifies elements to keep unchanged between requests."},
    {"hx-prompt", "Shows a `prompt()` before submitting a request."},
    {"hx-request", "Configures various aspects of the request (`timeout`, `credentials`, `noHeaders`)."},
    {"hx-sync", "Controls how requests made by different elements are synchronized (`drop`, `abort`, `replace`, `queue`)."},
    {"hx-validate", "Forces elements to validate themselves before a request."},
    {"hx-vals", "Adds to the parameters that will be submitted with a request (JSON)."},
    {"hx-vars", "Adds values dynamically to the parameters to submit with the request (deprecated, use `hx-vals`)."},
    {"hx-lsp", "References `hx@` tags declared in backend or JavaScript comments.\n\n```html\n<div hx-lsp=\"hx@users hx@orders\"></div>\n```"},
  };
}

std::unordered_map<std::string, std::vector<KnowledgeEntry>> builtin_values()
{
  std::unordered_map<std::string, std::vector<KnowledgeEntry>> v;

  v["hx-swap"] = {
    {"innerHTML", "Replace the inner html of the target element."},
    {"outerHTML", "Replace the entire target element with the response."},
    {"beforebegin", "Insert the response before the target element."},
    {"afterbegin", "Insert the response before the first child of the target element."},
    {"beforeend", "Insert the response after the last child of the target element."},
    {"afterend", "Insert the response after the target element."},
    {"delete", "Deletes the target element regardless of the response."},
    {"none", "Does not append content from response (out of band items will still be processed)."},
  };

  v["hx-target"] = {
    {"this", "The element the `hx-target` attribute is on is the target."},
    {"closest ", "Finds the closest ancestor element or itself that matches the given CSS selector (e.g. `closest tr`)."},
    {"find ", "Finds the first child descendant element that matches the given CSS selector (e.g. `find tr`)."},
    {"next", "Resolves to `element.nextElementSibling`."},
    {"next ", "Scans the DOM forward for the first element that matches the given CSS selector (e.g. `next .error`)."},
    {"previous", "Resolves to `element.previousElementSibling`."},
    {"previous ", "Scans the DOM backwards for the first element that matches the given CSS selector (e.g. `previous .error`)."},
  };

  v["hx-trigger"] = {
    {"click", "Triggered on click."},
    {"change", "Triggered on change (default for `input`, `textarea` and `select`)."},
    {"submit", "Triggered on submit (default for `form`)."},
    {"load", "Triggered on load (useful for lazy-loading something)."},
    {"revealed", "Triggered when an element is scrolled into the viewport."},
    {"intersect", "Fires once when an element first intersects the viewport."},
    {"every ", "Polls at the given interval (e.g. `every 1s`)."},
  };

  v["hx-boost"] = {
    {"true", "Enables boosting for this element and its children."},
    {"false", "Disables boosting for this element and its children."},
  };

  v["hx-push-url"] = {
    {"true", "Pushes the fetched URL into history."},
    {"false", "Disables pushing the fetched URL if it would otherwise be pushed due to inheritance or `hx-boost`."},
  };

  v["hx-encoding"] = {
    {"multipart/form-data", "Send the request body as `multipart/form-data` (file uploads)."},
  };

  v["hx-params"] = {
    {"*", "Include all parameters (default)."},
    {"none", "Include no parameters."},
    {"not ", "Include all except the comma separated list of parameter names."},
  };

  v["hx-sync"] = {
    {"drop", "Drop (ignore) this request if an existing request is in flight (the default)."},
    {"abort", "Drop (ignore) this request if an existing request is in flight, and, if that is not the case, abort this request if another request occurs while it is still in flight."},
    {"replace", "Abort the current request, if any, and replace it with this request."},
    {"queue", "Place this request in the request queue associated with the given element (`queue first`, `queue last`, `queue all`)."},
  };

  return v;
}

}  // namespace

KnowledgeBase::KnowledgeBase(
  std::vector<KnowledgeEntry> attributes,
  std::unordered_map<std::string, std::vector<KnowledgeEntry>> values)
: attributes_(std::move(attributes)), values_(std::move(values))
{
}

const KnowledgeBase & KnowledgeBase::builtin()
{
  static const KnowledgeBase kb(builtin_attributes(), builtin_values());
  return kb;
}

const KnowledgeEntry * KnowledgeBase::find_attribute(std::string_view name) const noexcept
{
  for (const auto & e : attributes_) {
    if (e.name == name) {
      return &e;
    }
  }
  return nullptr;
}

gsl::span<const KnowledgeEntry> KnowledgeBase::values_for(std::string_view attribute) const
{
  if (const auto it = values_.find(std::string(attribute)); it != values_.end()) {
    return it->second;
  }
  return {};
}

const KnowledgeEntry * KnowledgeBase::find_value(
  std::string_view attribute, std::string_view value) const
{
  for (const auto & e : values_for(attribute)) {
    if (e.name == value) {
      return &e;
    }
  }
  return nullptr;
}

}  // namespace htmx_lsp::lsp
