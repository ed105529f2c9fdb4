#include "sandbox/slot_pool.hpp"
#include <glog/logging.h>
#include <stdexcept>

namespace codejudge {
using namespace std;

sandbox_slot::sandbox_slot(slot_pool &pool, size_t core_id) : pool(&pool), id(core_id) {}

sandbox_slot::sandbox_slot(sandbox_slot &&other) noexcept : pool(other.pool), id(other.id) {
    other.pool = nullptr;
}

sandbox_slot::~sandbox_slot() {
    if (pool) pool->release(id);
}

size_t sandbox_slot::core_id() const {
    return id;
}

string sandbox_slot::cpuset() const {
    return to_string(id);
}

slot_pool::slot_pool(const vector<size_t> &core_ids) : total(core_ids.size()) {
    if (core_ids.empty())
        throw invalid_argument("slot pool requires at least one core");
    for (size_t core_id : core_ids)
        cores.push(core_id);
}

sandbox_slot slot_pool::acquire() {
    size_t core_id = cores.pop();
    DLOG(INFO) << "Acquired sandbox slot on core " << core_id;
    return sandbox_slot(*this, core_id);
}

size_t slot_pool::capacity() const {
    return total;
}

size_t slot_pool::available() const {
    return cores.size();
}

void slot_pool::release(size_t core_id) {
    cores.push(core_id);
}

}  // namespace codejudge
