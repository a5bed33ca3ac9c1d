// ============================================================================
// sdk_xml.cpp: implementation for sdk_xml.hpp
// Builders are plain string assembly; parsing goes through libxml2's tree API.
// ============================================================================

#include "ledlink/sdk_xml.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>

#include <libxml/parser.h>
#include <libxml/tree.h>

namespace ledlink {

namespace {

struct DocDeleter {
  void operator()(xmlDoc* d) const { xmlFreeDoc(d); }
};
using DocPtr = std::unique_ptr<xmlDoc, DocDeleter>;

struct BufferDeleter {
  void operator()(xmlBuffer* b) const { xmlBufferFree(b); }
};

constexpr int PARSE_FLAGS = XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING;

// Once per process, before the first parse from any thread.
void init_parser() {
  static const bool ready = [] {
    xmlInitParser();
    return true;
  }();
  (void)ready;
}

DocPtr parse_doc(const std::string& text) {
  init_parser();
  return DocPtr(xmlReadMemory(text.data(), static_cast<int>(text.size()),
                              "sdk.xml", "UTF-8", PARSE_FLAGS));
}

// Inner XML may hold several sibling elements; give it a single root.
DocPtr parse_fragment(const std::string& inner) {
  return parse_doc("<r>" + inner + "</r>");
}

bool is_element(const xmlNode* n, const char* name) {
  return n && n->type == XML_ELEMENT_NODE &&
         xmlStrcmp(n->name, reinterpret_cast<const xmlChar*>(name)) == 0;
}

std::string attr(const xmlNode* n, const char* name) {
  xmlChar* v = xmlGetProp(n, reinterpret_cast<const xmlChar*>(name));
  if (!v) return std::string();
  std::string s(reinterpret_cast<const char*>(v));
  xmlFree(v);
  return s;
}

int attr_int(const xmlNode* n, const char* name) {
  return static_cast<int>(std::strtol(attr(n, name).c_str(), nullptr, 10));
}

uint64_t attr_u64(const xmlNode* n, const char* name) {
  return static_cast<uint64_t>(std::strtoull(attr(n, name).c_str(), nullptr, 10));
}

// Depth-first search for the first element called `name`.
const xmlNode* find_element(const xmlNode* n, const char* name) {
  for (; n; n = n->next) {
    if (is_element(n, name)) return n;
    if (const xmlNode* hit = find_element(n->children, name)) return hit;
  }
  return nullptr;
}

template <class Fn>
void for_each_element(const xmlNode* n, Fn&& fn) {
  for (; n; n = n->next) {
    if (n->type == XML_ELEMENT_NODE) fn(n);
    for_each_element(n->children, fn);
  }
}

std::string serialize_children(xmlDoc* doc, const xmlNode* parent) {
  std::unique_ptr<xmlBuffer, BufferDeleter> buf(xmlBufferCreate());
  if (!buf) return std::string();
  for (xmlNode* c = parent->children; c; c = c->next) {
    xmlNodeDump(buf.get(), doc, c, 0, 0);
  }
  return std::string(reinterpret_cast<const char*>(xmlBufferContent(buf.get())),
                     static_cast<size_t>(xmlBufferLength(buf.get())));
}

bool is_space(unsigned char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

std::string trim(const std::string& s) {
  size_t b = 0, e = s.size();
  while (b < e && is_space(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && is_space(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

} // namespace

std::string xml_escape(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '&':  out += "&amp;";  break;
      case '<':  out += "&lt;";   break;
      case '>':  out += "&gt;";   break;
      case '"':  out += "&quot;"; break;
      case '\'': out += "&apos;"; break;
      default:   out += c;
    }
  }
  return out;
}

std::string clean_xml(const std::string& s) {
  static const char BOM[] = "\xEF\xBB\xBF";
  if (s.size() >= 3 && s.compare(0, 3, BOM) == 0) return trim(s.substr(3));
  return trim(s);
}

std::string clean_xml(const Bytes& b) {
  return clean_xml(std::string(b.begin(), b.end()));
}

std::string build_sdk_xml(const std::string& guid, const std::string& method,
                          const std::string& inner) {
  std::string x;
  x.reserve(96 + guid.size() + method.size() + inner.size());
  x += "<?xml version=\"1.0\" encoding=\"utf-8\"?>\r\n";
  x += "<sdk guid=\"" + xml_escape(guid) + "\">\r\n";
  x += "  <in method=\"" + xml_escape(method) + "\">";
  if (!inner.empty()) {
    x += "\r\n    ";
    x += inner;
    x += "\r\n  ";
  }
  x += "</in>\r\n</sdk>";
  return x;
}

std::string build_version_xml() {
  char hex[16];
  std::snprintf(hex, sizeof(hex), "%x", SDK_VERSION);
  return build_sdk_xml(GUID_PLACEHOLDER, method::GetIFVersion,
                       std::string("<version value=\"") + hex + "\"/>");
}

std::string build_delete_files_xml(const std::vector<std::string>& names) {
  if (names.empty()) return "<files/>";
  std::string x = "<files>";
  for (const auto& n : names) x += "<file name=\"" + xml_escape(n) + "\"/>";
  x += "</files>";
  return x;
}

bool parse_sdk_response(const std::string& raw, SdkResponse& out, Error& err) {
  DocPtr doc = parse_doc(raw);
  if (!doc) {
    err = protocol_error(ProtocolFault::MalformedXml, "sdk response is not well-formed xml");
    return false;
  }

  SdkResponse r;
  r.raw_xml = raw;

  const xmlNode* root = xmlDocGetRootElement(doc.get());
  if (const xmlNode* sdk = find_element(root, "sdk")) {
    r.guid = attr(sdk, "guid");
    if (const xmlNode* o = find_element(sdk->children, "out")) {
      r.method = attr(o, "method");
      r.result = attr(o, "result");
      r.inner_xml = trim(serialize_children(doc.get(), o));
    }
  }

  if (r.guid.empty() && r.method.empty()) {
    err = protocol_error(ProtocolFault::MalformedXml, "sdk response has neither guid nor method");
    return false;
  }

  out = std::move(r);
  return true;
}

bool parse_device_info(const std::string& inner, DeviceInfo& out, Error& err) {
  DocPtr doc = parse_fragment(inner);
  if (!doc) {
    err = protocol_error(ProtocolFault::MalformedXml, "device info is not well-formed xml");
    return false;
  }

  DeviceInfo info;
  for_each_element(xmlDocGetRootElement(doc.get()), [&](const xmlNode* n) {
    if (is_element(n, "device")) {
      info.cpu         = attr(n, "cpu");
      info.model       = attr(n, "model");
      info.device_id   = attr(n, "id");
      info.device_name = attr(n, "name");
    } else if (is_element(n, "version")) {
      info.fpga_version   = attr(n, "fpga");
      info.app_version    = attr(n, "app");
      info.kernel_version = attr(n, "kernel");
    } else if (is_element(n, "screen")) {
      info.screen_width    = attr_int(n, "width");
      info.screen_height   = attr_int(n, "height");
      info.screen_rotation = attr_int(n, "rotation");
    }
  });

  out = std::move(info);
  return true;
}

bool parse_file_list(const std::string& inner, std::vector<RemoteFile>& out, Error& err) {
  DocPtr doc = parse_fragment(inner);
  if (!doc) {
    err = protocol_error(ProtocolFault::MalformedXml, "file list is not well-formed xml");
    return false;
  }

  std::vector<RemoteFile> files;
  for_each_element(xmlDocGetRootElement(doc.get()), [&](const xmlNode* n) {
    if (!is_element(n, "file")) return;
    RemoteFile f;
    f.name       = attr(n, "name");
    f.size       = attr_u64(n, "size");
    f.exist_size = attr_u64(n, "existSize");
    f.md5        = attr(n, "md5");
    f.type       = attr(n, "type");
    files.push_back(std::move(f));
  });

  out = std::move(files);
  return true;
}

} // namespace ledlink
