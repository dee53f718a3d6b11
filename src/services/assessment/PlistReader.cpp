#include "PlistReader.hpp"

#include <libxml/parser.h>
#include <libxml/tree.h>

#include <cstring>
#include <memory>
#include <stdexcept>

namespace sigdrift {

namespace {

using DocPtr = std::unique_ptr<xmlDoc, decltype(&xmlFreeDoc)>;

bool is_element(const xmlNode* n, const char* name) {
  return n && n->type == XML_ELEMENT_NODE &&
         std::strcmp(reinterpret_cast<const char*>(n->name), name) == 0;
}

const xmlNode* next_element(const xmlNode* n) {
  while (n && n->type != XML_ELEMENT_NODE) n = n->next;
  return n;
}

std::string node_text(const xmlNode* n) {
  xmlChar* content = xmlNodeGetContent(n);
  if (!content) return {};
  std::string out(reinterpret_cast<const char*>(content));
  xmlFree(content);
  return out;
}

} // namespace

std::map<std::string, std::string> read_plist_dict(std::string_view xml) {
  DocPtr doc(xmlReadMemory(xml.data(), static_cast<int>(xml.size()), "assessment.plist", nullptr,
                           XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING),
             &xmlFreeDoc);
  if (!doc) throw std::runtime_error("property list is not well-formed XML");

  const xmlNode* root = xmlDocGetRootElement(doc.get());
  if (!is_element(root, "plist")) throw std::runtime_error("missing <plist> root element");

  const xmlNode* dict = next_element(root->children);
  if (!is_element(dict, "dict")) throw std::runtime_error("property list root is not a <dict>");

  std::map<std::string, std::string> out;
  const xmlNode* n = next_element(dict->children);
  while (n) {
    if (!is_element(n, "key")) {
      throw std::runtime_error("expected <key> in <dict>, found <" +
                               std::string(reinterpret_cast<const char*>(n->name)) + ">");
    }
    const std::string key = node_text(n);
    const xmlNode* value = next_element(n->next);
    if (!value) throw std::runtime_error("<key>" + key + "</key> has no value");

    if (is_element(value, "true")) {
      out[key] = "true";
    } else if (is_element(value, "false")) {
      out[key] = "false";
    } else if (is_element(value, "string") || is_element(value, "integer") ||
               is_element(value, "real") || is_element(value, "date")) {
      out[key] = node_text(value);
    }
    // <dict>, <array>, <data>: not needed by callers

    n = next_element(value->next);
  }
  return out;
}

} // namespace sigdrift
