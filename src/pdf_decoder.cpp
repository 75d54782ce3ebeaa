#include "pdf_decoder.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include <sys/wait.h>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

std::string trim(const std::string& s) {
  size_t a = 0, b = s.size();
  while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) a++;
  while (b > a && std::isspace(static_cast<unsigned char>(s[b-1]))) b--;
  return s.substr(a, b - a);
}

std::string decodeEntities(const std::string& in) {
  std::string out;
  out.reserve(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    if (in[i] == '&') {
      size_t j = in.find(';', i + 1);
      if (j != std::string::npos && j - i <= 10) {
        std::string ent = in.substr(i + 1, j - (i + 1));
        std::string rep;
        if (ent == "amp") rep = "&";
        else if (ent == "lt") rep = "<";
        else if (ent == "gt") rep = ">";
        else if (ent == "quot") rep = "\"";
        else if (ent == "apos") rep = "'";
        else if (ent.size() > 1 && ent[0] == '#') {
          bool hex = ent[1] == 'x' || ent[1] == 'X';
          std::string digits = ent.substr(hex ? 2 : 1);
          char* endp = nullptr;
          unsigned long code = std::strtoul(digits.c_str(), &endp, hex ? 16 : 10);
          if (!digits.empty() && endp && *endp == '\0' && code <= 0x7F) {
            rep.push_back(static_cast<char>(code));
          }
        }
        if (!rep.empty()) {
          out += rep; i = j; continue;
        }
      }
    }
    out.push_back(in[i]);
  }
  return out;
}

std::string shellQuote(const std::string& arg) {
  std::string out = "'";
  for (char ch : arg) {
    if (ch == '\'') out += "'\\''";
    else out.push_back(ch);
  }
  out += "'";
  return out;
}

bool commandExists(const std::string& command) {
  std::string test = "command -v " + command + " >/dev/null 2>&1";
  return std::system(test.c_str()) == 0;
}

void requireCommand(const std::string& command, const std::string& package) {
  if (!commandExists(command)) {
    throw std::runtime_error(command + " not found; install " + package);
  }
}

struct CommandOutput {
  std::string out;
  int exitCode;
};

CommandOutput runCapture(const std::string& cmd) {
  FILE* pipe = popen(cmd.c_str(), "r");
  if (!pipe) throw std::runtime_error("Failed to run: " + cmd);
  std::string out;
  char buf[8192];
  while (true) {
    size_t n = std::fread(buf, 1, sizeof(buf), pipe);
    if (n > 0) out.append(buf, n);
    if (n < sizeof(buf)) break;
  }
  int status = pclose(pipe);
  int code = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
  return {out, code};
}

void checkPdfSignature(const std::string& pdfPath) {
  std::ifstream in(pdfPath, std::ios::binary);
  if (!in) throw DecodeError("cannot open " + pdfPath, std::nullopt, 0);
  std::string head(1024, '\0');
  in.read(&head[0], static_cast<std::streamsize>(head.size()));
  head.resize(static_cast<size_t>(in.gcount()));
  if (head.find("%PDF-") == std::string::npos) {
    throw DecodeError(pdfPath + " has no %PDF- header in its first 1024 bytes", std::nullopt, 0);
  }
}

std::optional<std::string> optionalValue(const std::unordered_map<std::string, std::string>& kv,
                                         const std::string& key) {
  auto it = kv.find(key);
  if (it == kv.end() || it->second.empty()) return std::nullopt;
  return it->second;
}

std::unordered_map<std::string, std::string> parseAttributes(const std::string& tag) {
  static const std::regex attrRe("([A-Za-z]+)=\"([^\"]*)\"");
  std::unordered_map<std::string, std::string> attrs;
  for (auto it = std::sregex_iterator(tag.begin(), tag.end(), attrRe); it != std::sregex_iterator(); ++it) {
    attrs[(*it)[1].str()] = (*it)[2].str();
  }
  return attrs;
}

double numberAttr(const std::unordered_map<std::string, std::string>& attrs, const char* key) {
  auto it = attrs.find(key);
  if (it == attrs.end()) return 0.0;
  return std::strtod(it->second.c_str(), nullptr);
}

BoundingBox boxFromAttributes(const std::unordered_map<std::string, std::string>& attrs) {
  BoundingBox b;
  b.x0 = numberAttr(attrs, "xMin");
  b.y0 = numberAttr(attrs, "yMin");
  b.x1 = numberAttr(attrs, "xMax");
  b.y1 = numberAttr(attrs, "yMax");
  return b;
}

bool startsWithTag(const std::string& tag, const char* name) {
  const size_t len = std::char_traits<char>::length(name);
  if (tag.compare(0, len, name) != 0) return false;
  return tag.size() == len || tag[len] == ' ' || tag[len] == '>' || tag[len] == '/';
}

std::string stripName(const std::string& name) {
  return (!name.empty() && name[0] == '/') ? name.substr(1) : name;
}

// Resolves "N G R" references against the "qpdf" section of a v2 dump.
const json* lookupObject(const json& objects, const json& ref) {
  if (!ref.is_string()) return nullptr;
  auto it = objects.find("obj:" + ref.get<std::string>());
  if (it == objects.end() || !it->is_object()) return nullptr;
  auto value = it->find("value");
  if (value == it->end() || !value->is_object()) return nullptr;
  return &*value;
}

std::optional<BoundingBox> rectToBox(const json& annotation, double pageHeight) {
  auto rect = annotation.find("/Rect");
  if (rect == annotation.end() || !rect->is_array() || rect->size() != 4) return std::nullopt;
  for (const auto& v : *rect) {
    if (!v.is_number()) return std::nullopt;
  }
  const double llx = (*rect)[0].get<double>();
  const double lly = (*rect)[1].get<double>();
  const double urx = (*rect)[2].get<double>();
  const double ury = (*rect)[3].get<double>();
  BoundingBox b;
  b.x0 = std::min(llx, urx);
  b.x1 = std::max(llx, urx);
  b.y0 = pageHeight - std::max(lly, ury);
  b.y1 = pageHeight - std::min(lly, ury);
  return b;
}

std::vector<std::string> onStates(const json& annotation) {
  std::vector<std::string> states;
  auto ap = annotation.find("/AP");
  if (ap == annotation.end() || !ap->is_object()) return states;
  auto normal = ap->find("/N");
  if (normal == ap->end() || !normal->is_object()) return states;
  for (auto it = normal->begin(); it != normal->end(); ++it) {
    if (it.key() != "/Off") states.push_back(stripName(it.key()));
  }
  return states;
}

BoundingBox unite(const BoundingBox& a, const BoundingBox& b) {
  BoundingBox u;
  u.x0 = std::min(a.x0, b.x0);
  u.y0 = std::min(a.y0, b.y0);
  u.x1 = std::max(a.x1, b.x1);
  u.y1 = std::max(a.y1, b.y1);
  return u;
}

constexpr int kFlagRadio = 1 << 15;

} // namespace

std::string toString(TextGranularity granularity) {
  return granularity == TextGranularity::Word ? "word" : "line";
}

TextGranularity textGranularityFromString(const std::string& name) {
  if (name == "line") return TextGranularity::Line;
  if (name == "word") return TextGranularity::Word;
  throw std::runtime_error("unknown text granularity: " + name + " (expected line or word)");
}

DocumentMetadata parsePdfInfo(const std::string& output) {
  std::unordered_map<std::string, std::string> kv;
  std::istringstream in(output);
  std::string line;
  while (std::getline(in, line)) {
    size_t colon = line.find(':');
    if (colon == std::string::npos) continue;
    kv[trim(line.substr(0, colon))] = trim(line.substr(colon + 1));
  }

  DocumentMetadata meta;
  meta.title = optionalValue(kv, "Title");
  meta.author = optionalValue(kv, "Author");
  meta.subject = optionalValue(kv, "Subject");
  meta.creationDate = optionalValue(kv, "CreationDate");
  meta.modificationDate = optionalValue(kv, "ModDate");

  auto pages = optionalValue(kv, "Pages");
  if (!pages) throw DecodeError("pdfinfo did not report a page count");
  char* endp = nullptr;
  long count = std::strtol(pages->c_str(), &endp, 10);
  if (endp == pages->c_str() || *endp != '\0' || count < 0) {
    throw DecodeError("pdfinfo reported an invalid page count: " + *pages);
  }
  meta.pageCount = static_cast<int>(count);
  return meta;
}

std::vector<DecodedPage> parseBboxLayout(const std::string& xhtml, TextGranularity granularity) {
  std::vector<DecodedPage> pages;
  DecodedPage* page = nullptr;
  std::optional<TextSpan> line;

  size_t pos = 0;
  while (true) {
    size_t open = xhtml.find('<', pos);
    if (open == std::string::npos) break;
    size_t close = xhtml.find('>', open);
    if (close == std::string::npos) break;
    const std::string tag = xhtml.substr(open + 1, close - open - 1);
    pos = close + 1;

    if (startsWithTag(tag, "page")) {
      auto attrs = parseAttributes(tag);
      DecodedPage p;
      p.pageNumber = static_cast<int>(pages.size()) + 1;
      p.width = numberAttr(attrs, "width");
      p.height = numberAttr(attrs, "height");
      pages.push_back(std::move(p));
      page = &pages.back();
      line.reset();
    } else if (page && startsWithTag(tag, "line")) {
      line = TextSpan{page->pageNumber, boxFromAttributes(parseAttributes(tag)), std::string()};
    } else if (page && startsWithTag(tag, "word")) {
      size_t end = xhtml.find("</word>", pos);
      if (end == std::string::npos) break;
      std::string text = trim(decodeEntities(xhtml.substr(pos, end - pos)));
      pos = end + 7;
      if (text.empty()) continue;
      if (granularity == TextGranularity::Word) {
        page->textSpans.push_back(TextSpan{page->pageNumber, boxFromAttributes(parseAttributes(tag)), text});
      } else if (line) {
        if (!line->text.empty()) line->text += ' ';
        line->text += text;
      }
    } else if (page && tag == "/line") {
      if (line && !line->text.empty()) page->textSpans.push_back(std::move(*line));
      line.reset();
    }
  }

  return pages;
}

std::map<int, std::vector<NativeControl>> parseQpdfAcroform(const std::string& text,
                                                            const std::vector<DecodedPage>& pages) {
  json doc = json::parse(text, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    throw DecodeError("qpdf produced unreadable JSON");
  }

  const json empty = json::object();
  const json* objects = &empty;
  auto qpdfSection = doc.find("qpdf");
  if (qpdfSection != doc.end() && qpdfSection->is_array() && qpdfSection->size() > 1 &&
      (*qpdfSection)[1].is_object()) {
    objects = &(*qpdfSection)[1];
  }

  std::map<int, std::vector<NativeControl>> controls;
  std::unordered_map<std::string, std::pair<int, size_t>> byName;

  auto acroform = doc.find("acroform");
  if (acroform == doc.end() || !acroform->is_object()) return controls;
  auto fields = acroform->find("fields");
  if (fields == acroform->end() || !fields->is_array()) return controls;

  for (const auto& field : *fields) {
    if (!field.is_object()) continue;

    const int pageNumber = field.value("pageposfrom1", 0);
    if (pageNumber < 1 || pageNumber > static_cast<int>(pages.size())) {
      throw DecodeError("form field refers to page " + std::to_string(pageNumber) +
                        " of a " + std::to_string(pages.size()) + " page document", pageNumber);
    }
    const double pageHeight = pages[pageNumber - 1].height;

    const json* annotation = nullptr;
    auto annot = field.find("annotation");
    if (annot != field.end() && annot->is_object()) {
      auto ref = annot->find("object");
      if (ref != annot->end()) annotation = lookupObject(*objects, *ref);
    }

    NativeControl c;
    std::string fullname = field.value("fullname", std::string());
    if (!trim(fullname).empty()) c.name = fullname;
    c.kind = field.value("fieldtype", std::string());
    c.flags = field.value("fieldflags", 0);
    if (annotation) c.box = rectToBox(*annotation, pageHeight);

    std::vector<std::string> options;
    bool hasOptions = false;
    if (field.value("ischoice", false)) {
      auto choices = field.find("choices");
      if (choices != field.end() && choices->is_array()) {
        for (const auto& choice : *choices) {
          if (choice.is_string()) options.push_back(choice.get<std::string>());
        }
        hasOptions = true;
      }
    } else if (field.value("isradiobutton", false) || (c.flags & kFlagRadio)) {
      if (annotation) options = onStates(*annotation);
      hasOptions = !options.empty();
    }

    if (c.name) {
      auto seen = byName.find(*c.name);
      if (seen != byName.end()) {
        NativeControl& first = controls[seen->second.first][seen->second.second];
        if (seen->second.first == pageNumber && first.box && c.box) {
          first.box = unite(*first.box, *c.box);
        }
        if (hasOptions && !field.value("ischoice", false)) {
          if (!first.options) first.options = std::vector<std::string>();
          first.options->insert(first.options->end(), options.begin(), options.end());
        }
        continue;
      }
    }

    if (hasOptions) c.options = std::move(options);
    auto& onPage = controls[pageNumber];
    if (c.name) byName.emplace(*c.name, std::make_pair(pageNumber, onPage.size()));
    onPage.push_back(std::move(c));
  }

  return controls;
}

DecodedDocument decodePdf(const std::string& pdfPath, const DecoderOptions& options) {
  checkPdfSignature(pdfPath);
  requireCommand("pdfinfo", "poppler-utils (e.g., apt-get install -y poppler-utils)");
  requireCommand("pdftotext", "poppler-utils (e.g., apt-get install -y poppler-utils)");
  requireCommand("qpdf", "qpdf (e.g., apt-get install -y qpdf)");

  const std::string quoted = shellQuote(pdfPath);

  CommandOutput info = runCapture("pdfinfo -isodates " + quoted + " 2>/dev/null");
  if (info.exitCode != 0) throw DecodeError("pdfinfo could not read " + pdfPath);

  DecodedDocument document;
  document.metadata = parsePdfInfo(info.out);

  CommandOutput layout = runCapture("pdftotext -bbox-layout -q " + quoted + " -");
  if (layout.exitCode != 0) throw DecodeError("pdftotext -bbox-layout could not read " + pdfPath);
  document.pages = parseBboxLayout(layout.out, options.granularity);

  // qpdf exits with 3 when it succeeded with warnings.
  CommandOutput form = runCapture("qpdf --json=2 --json-key=acroform --json-key=qpdf " + quoted + " 2>/dev/null");
  if (form.exitCode != 0 && form.exitCode != 3) throw DecodeError("qpdf could not read " + pdfPath);

  auto controls = parseQpdfAcroform(form.out, document.pages);
  for (auto& page : document.pages) {
    auto it = controls.find(page.pageNumber);
    if (it != controls.end()) page.controls = std::move(it->second);
  }

  return document;
}
