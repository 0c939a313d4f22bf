#include <linedocs/record/doc_state.h>

#include <string>

namespace linedocs {

DocState::DocState(bool use_doc_values)
    : title_dv_(nullptr), id_(0) {
    title_ = &doc_.add(Field("title", FieldType::string_field(false)));
    title_tokenized_ =
        &doc_.add(Field("titleTokenized", FieldType::text_with_vectors()));
    body_ = &doc_.add(Field("body", FieldType::text_with_vectors()));
    id_field_ = &doc_.add(Field("docid", FieldType::string_field(true)));
    date_ = &doc_.add(Field("date", FieldType::string_field(true)));
    if (use_doc_values) {
        title_dv_ = &doc_.add(Field("titleDV", FieldType::sorted_doc_values()));
    }
}

void DocState::assign(const LineFields &fields, std::uint64_t id) {
    title_->set_string_value(fields.title);
    title_tokenized_->set_string_value(fields.title);
    body_->set_string_value(fields.body);
    date_->set_string_value(fields.date);
    id_field_->set_string_value(std::to_string(id));
    if (title_dv_) {
        title_dv_->set_bytes_value(fields.title.data(), fields.title.size());
    }
    id_ = id;
}

namespace {
std::atomic<std::uint64_t> next_generation(1);

// Last pool this thread used
struct LocalCache {
    std::uint64_t generation = 0;
    DocState *state = nullptr;
};
thread_local LocalCache local_cache;
}  // namespace

RecordBufferPool::RecordBufferPool(bool use_doc_values)
    : use_doc_values_(use_doc_values),
      generation_(next_generation.fetch_add(1)) {}

DocState &RecordBufferPool::local() {
    const std::uint64_t generation = generation_.load();
    if (local_cache.generation == generation) {
        return *local_cache.state;
    }
    DocState &state = lookup();
    local_cache.generation = generation;
    local_cache.state = &state;
    return state;
}

DocState &RecordBufferPool::lookup() {
    const auto tid = std::this_thread::get_id();
    std::lock_guard<std::mutex> lock(mutex_);
    auto &state = states_[tid];
    if (!state) {
        state = std::make_unique<DocState>(use_doc_values_);
    }
    return *state;
}

void RecordBufferPool::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    states_.clear();
    generation_.store(next_generation.fetch_add(1));
}

std::size_t RecordBufferPool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return states_.size();
}

}  // namespace linedocs
