#include "rag_core/types/file_type.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

#include "rag_core/errors.hpp"

namespace rag_core {

std::string to_string(FileType type) {
  switch (type) {
    case FileType::Pdf:
      return "pdf";
    case FileType::Slide:
      return "slide";
    case FileType::Doc:
      return "doc";
    case FileType::Text:
      return "text";
    case FileType::Csv:
      return "csv";
    case FileType::Image:
      return "image";
  }
  return "unknown";
}

FileType file_type_from_string(const std::string& str) {
  static const std::unordered_map<std::string, FileType> kNames = {
      {"pdf", FileType::Pdf},       {"slide", FileType::Slide},   {"pptx", FileType::Slide},
      {"ppt", FileType::Slide},     {"doc", FileType::Doc},       {"docx", FileType::Doc},
      {"md", FileType::Doc},        {"markdown", FileType::Doc},  {"text", FileType::Text},
      {"txt", FileType::Text},      {"csv", FileType::Csv},       {"image", FileType::Image},
      {"png", FileType::Image},     {"jpg", FileType::Image},     {"jpeg", FileType::Image},
  };

  std::string key = str;
  if (!key.empty() && key.front() == '.') {
    key.erase(0, 1);
  }
  std::transform(key.begin(), key.end(), key.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  auto it = kNames.find(key);
  if (it == kNames.end()) {
    throw ValidationError("Unknown file type: '" + str + "'");
  }
  return it->second;
}

const std::vector<FileType>& all_file_types() {
  static const std::vector<FileType> kTypes = {FileType::Pdf,  FileType::Slide, FileType::Doc,
                                               FileType::Text, FileType::Csv,   FileType::Image};
  return kTypes;
}

}  // namespace rag_core
