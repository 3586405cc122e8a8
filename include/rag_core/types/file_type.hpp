#pragma once

#include <string>
#include <vector>

namespace rag_core {

// Closed set of document kinds. Governs chunking and how section_label reads.
enum class FileType { Pdf, Slide, Doc, Text, Csv, Image };

std::string to_string(FileType type);

// Accepts canonical names and common extensions (pptx, docx, txt, png, ...).
// Throws ValidationError for anything else.
FileType file_type_from_string(const std::string& str);

const std::vector<FileType>& all_file_types();

}  // namespace rag_core
