#include <linedocs/document/document.h>

#include <utility>

namespace linedocs {

FieldType FieldType::string_field(bool stored) {
    FieldType type;
    type.stored = stored;
    return type;
}

FieldType FieldType::text_with_vectors() {
    FieldType type;
    type.tokenized = true;
    type.stored = true;
    type.store_term_vectors = true;
    type.store_term_vector_offsets = true;
    type.store_term_vector_positions = true;
    return type;
}

FieldType FieldType::sorted_doc_values() {
    FieldType type;
    type.indexed = false;
    type.doc_values = DocValuesType::SORTED;
    return type;
}

Field::Field(std::string name, FieldType type)
    : name_(std::move(name)), type_(type) {}

void Field::set_string_value(std::string_view value) {
    value_.assign(value.data(), value.size());
}

void Field::set_bytes_value(const char *data, std::size_t size) {
    value_.assign(data, size);
}

Field &Document::add(Field field) {
    fields_.push_back(std::make_unique<Field>(std::move(field)));
    return *fields_.back();
}

const Field *Document::get_field(const std::string &name) const {
    for (const auto &field : fields_) {
        if (field->name() == name) {
            return field.get();
        }
    }
    return nullptr;
}

std::string Document::get(const std::string &name) const {
    const Field *field = get_field(name);
    return field ? field->value() : std::string();
}

}  // namespace linedocs
