#include "dynrec/value/value.hpp"
#include "dynrec/value/generic_record.hpp"
#include "dynrec/errors.hpp"

#include <sstream>

namespace dynrec {

bool operator==(const Value& lhs, const Value& rhs) {
    if (lhs.storage_.index() != rhs.storage_.index()) {
        return false;
    }
    if (const auto* l = lhs.get_if<Value::RecordPtr>()) {
        const auto& r = rhs.as<Value::RecordPtr>();
        if (!*l || !r) {
            return *l == r;
        }
        return **l == *r;
    }
    return lhs.storage_ == rhs.storage_;
}

std::string Value::describe() const {
    std::ostringstream out;
    switch (kind()) {
        case ValueKind::Null:    out << "null"; break;
        case ValueKind::Boolean: out << (as<bool>() ? "true" : "false"); break;
        case ValueKind::Int:     out << as<int32_t>(); break;
        case ValueKind::Long:    out << as<int64_t>() << "L"; break;
        case ValueKind::Float:   out << as<float>() << "f"; break;
        case ValueKind::Double:  out << as<double>(); break;
        case ValueKind::String:  out << '"' << as<std::string>() << '"'; break;
        case ValueKind::Bytes:   out << "bytes[" << as<Bytes>().size() << "]"; break;
        case ValueKind::Enum:    out << as<EnumSymbol>().symbol; break;
        case ValueKind::Array: {
            out << "[";
            const auto& items = as<Array>();
            for (std::size_t i = 0; i < items.size(); ++i) {
                out << (i ? ", " : "") << items[i].describe();
            }
            out << "]";
            break;
        }
        case ValueKind::Map: {
            out << "{";
            bool first = true;
            for (const auto& [key, value] : as<Map>()) {
                out << (first ? "" : ", ") << key << ": " << value.describe();
                first = false;
            }
            out << "}";
            break;
        }
        case ValueKind::Record: {
            const auto& record = as<RecordPtr>();
            out << "record " << (record ? record->schema().full_name() : std::string("<none>"));
            break;
        }
    }
    return out.str();
}

void Value::throw_kind_mismatch(ValueKind expected) const {
    throw InvalidFieldError(std::string("expected ") + to_string(expected) + " value, got " + to_string(kind()));
}

} // namespace dynrec
