#ifndef LINEDOCS_DOCUMENT_DOCUMENT_H
#define LINEDOCS_DOCUMENT_DOCUMENT_H

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace linedocs {

enum class DocValuesType { NONE, SORTED };

struct FieldType {
    bool indexed = true;
    bool tokenized = false;
    bool stored = false;
    bool store_term_vectors = false;
    bool store_term_vector_offsets = false;
    bool store_term_vector_positions = false;
    DocValuesType doc_values = DocValuesType::NONE;

    // Indexed as a single token
    static FieldType string_field(bool stored);
    // Tokenized, stored, with term vectors, offsets and positions
    static FieldType text_with_vectors();
    // Not indexed, only a sorted doc-values entry
    static FieldType sorted_doc_values();
};

/**
 * A named value inside a Document. Values are overwritten in place when a
 * record buffer is reused.
 */
class Field {
   public:
    Field(std::string name, FieldType type);

    const std::string &name() const { return name_; }
    const FieldType &type() const { return type_; }

    // String value, or the raw bytes for a doc-values field
    const std::string &value() const { return value_; }

    void set_string_value(std::string_view value);
    void set_bytes_value(const char *data, std::size_t size);

   private:
    std::string name_;
    FieldType type_;
    std::string value_;
};

class Document {
   public:
    Document() = default;
    Document(const Document &) = delete;
    Document &operator=(const Document &) = delete;

    Field &add(Field field);

    /**
     * @return the first field named name, nullptr if absent
     */
    const Field *get_field(const std::string &name) const;

    /**
     * @return the value of the first field named name, empty if absent
     */
    std::string get(const std::string &name) const;

    std::size_t size() const { return fields_.size(); }
    const Field &operator[](std::size_t idx) const { return *fields_[idx]; }

   private:
    std::vector<std::unique_ptr<Field>> fields_;
};

}  // namespace linedocs

#endif  // LINEDOCS_DOCUMENT_DOCUMENT_H
