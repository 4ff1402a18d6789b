#include "trace.hpp"

#include <algorithm>
#include <iterator>
#include <sstream>

std::string to_string(TraceKind kind) {
    switch (kind) {
        case TraceKind::Mined:
            return "Mined";
        case TraceKind::Accepted:
            return "Accepted";
        case TraceKind::Rejected:
            return "Rejected";
        case TraceKind::Buffered:
            return "Buffered";
        case TraceKind::Dropped:
            return "Dropped";
        case TraceKind::ForkCheck:
            return "ForkCheck";
        case TraceKind::Unresolved:
            return "Unresolved";
    }
    return "Unknown";
}

std::ostream& operator<<(std::ostream& out, const TraceRecord& record) {
    out << "[" << record.time << "] " << to_string(record.kind) << " node=" << record.node
        << " block=" << record.block_id << " parent=" << record.parent_id << " head=" << record.head
        << " h=" << record.head_height;
    if (!record.detail.empty()) {
        out << " (" << record.detail << ")";
    }
    return out;
}

void to_json(json& j, const TraceRecord& record) {
    j = json{
        {"time", record.time},
        {"node", record.node},
        {"block", record.block_id},
        {"parent", record.parent_id},
        {"kind", to_string(record.kind)},
        {"head", record.head},
        {"head_height", record.head_height},
        {"height", record.block_height},
    };
    if (record.sender != kNoNode) {
        j["sender"] = record.sender;
    }
    if (!record.detail.empty()) {
        j["detail"] = record.detail;
    }
}

size_t Trace::count(TraceKind kind) const {
    return std::count_if(records_.begin(), records_.end(), [kind](const TraceRecord& record) {
        return record.kind == kind;
    });
}

std::vector<TraceRecord> Trace::of_kind(TraceKind kind) const {
    std::vector<TraceRecord> result;
    std::copy_if(records_.begin(), records_.end(), std::back_inserter(result), [kind](const TraceRecord& record) {
        return record.kind == kind;
    });
    return result;
}

void Trace::dump(std::ostream& out) const {
    for (const auto& record : records_) {
        out << json(record).dump() << "\n";
    }
}

std::string Trace::dump() const {
    std::ostringstream out;
    dump(out);
    return out.str();
}
