#include "Materialize.h"

#include <unordered_set>

#include "JsonString.h"
#include "Object.h"

namespace lazyjson::json {

namespace {

constexpr std::size_t kArrayReserve = 16;

// Appends members in O(1); a repeated key overwrites the earlier value in its original slot.
class ObjectBuilder {
public:
    explicit ObjectBuilder(Object &object) : object_(object), tail_(object.head()) {}

    void add(std::string key, Value value) {
        if (seen_.contains(key)) {
            *object_.find(key) = std::move(value);
            return;
        }
        tail_ = object_.append_after(tail_, std::move(key), std::move(value));
        // Node keys never move once linked.
        seen_.insert(tail_->key);
    }

private:
    Object &object_;
    Object::Node *tail_;
    std::unordered_set<std::string_view> seen_;
};

void count_value(const LazyValue &value) {
    if (value.options().counters) {
        value.options().counters->values_materialized += 1;
    }
}

Value number_value(NumberResult &&number) {
    switch (number.tag) {
    case NumberResult::Tag::Int:
        return Value(number.i);
    case NumberResult::Tag::Float:
        return Value(number.f);
    case NumberResult::Tag::BigInt:
        return Value(std::move(number.big_int));
    case NumberResult::Tag::BigFloat:
        return Value(std::move(number.big_float));
    }
    return Value();
}

std::unexpected<JsonError> locate(JsonError error, const LazyValue &value) {
    if (error.context.empty() && error.offset == 0) {
        return std::unexpected(make_error(error.code, value.buffer(), value.position()));
    }
    return std::unexpected(std::move(error));
}

} // namespace

JsonResult<std::size_t> materialize(const LazyValue &value, Value &out) {
    count_value(value);
    switch (value.kind()) {
    case LazyKind::Object: {
        auto object = std::make_shared<Object>();
        ObjectBuilder builder(*object);
        auto end = walk_object(value, [&](const RawString &key, const LazyValue &child) -> JsonResult<WalkStep> {
            Value member;
            auto child_end = materialize(child, member);
            if (!child_end) {
                return std::unexpected(std::move(child_end.error()));
            }
            builder.add(key.to_owned(), std::move(member));
            return WalkStep::consumed(*child_end);
        });
        if (!end) {
            return std::unexpected(std::move(end.error()));
        }
        out = Value(std::move(object));
        return end->pos;
    }
    case LazyKind::Array: {
        auto array = std::make_shared<Array>();
        array->reserve(kArrayReserve);
        auto end = walk_array(value, [&](std::size_t, const LazyValue &child) -> JsonResult<WalkStep> {
            Value element;
            auto child_end = materialize(child, element);
            if (!child_end) {
                return std::unexpected(std::move(child_end.error()));
            }
            array->push_back(std::move(element));
            return WalkStep::consumed(*child_end);
        });
        if (!end) {
            return std::unexpected(std::move(end.error()));
        }
        out = Value(std::move(array));
        return end->pos;
    }
    case LazyKind::String: {
        auto str = scan_raw_string(value.buffer(), value.position());
        if (!str) {
            return std::unexpected(std::move(str.error()));
        }
        out = Value(str->to_owned());
        return str->end();
    }
    case LazyKind::Number: {
        auto scan = scan_number(value.buffer(), value.position(), value.options());
        if (!scan) {
            return std::unexpected(std::move(scan.error()));
        }
        out = number_value(std::move(scan->value));
        return scan->end;
    }
    case LazyKind::True:
        out = Value(true);
        return value.position() + 4;
    case LazyKind::False:
        out = Value(false);
        return value.position() + 5;
    case LazyKind::Null:
        out = Value();
        return value.position() + 4;
    }
    return fail(JsonErrc::InvalidJSON, value.buffer(), value.position());
}

JsonResult<Value> materialize(const LazyValue &value) {
    Value out;
    auto end = materialize(value, out);
    if (!end) {
        return std::unexpected(std::move(end.error()));
    }
    return out;
}

JsonResult<Value> parse(const LazyValue &value) {
    Value out;
    auto end = materialize(value, out);
    if (!end) {
        return std::unexpected(std::move(end.error()));
    }
    if (value.is_root()) {
        auto tail = check_end(value.buffer(), *end);
        if (!tail) {
            return std::unexpected(std::move(tail.error()));
        }
    }
    return out;
}

JsonResult<Value> parse(std::string_view input, const ReadOptions &options) {
    auto root = lazy(input, options);
    if (!root) {
        return std::unexpected(std::move(root.error()));
    }
    return parse(*root);
}

JsonResult<RawJson> materialize_raw(const LazyValue &value) {
    auto text = value.raw();
    if (!text) {
        return std::unexpected(std::move(text.error()));
    }
    return RawJson{std::string(*text)};
}

JsonResult<Target *> Target::choose(const LazyValue &) {
    return this;
}

JsonResult<Target *> Target::field(std::string_view) {
    return target_error(JsonErrc::TypeMismatch);
}

JsonResult<Target *> Target::element(std::size_t) {
    return target_error(JsonErrc::TypeMismatch);
}

JsonResult<void> Target::lift(Value &&) {
    return target_error(JsonErrc::TypeMismatch);
}

JsonResult<void> Target::construct() {
    return {};
}

std::unexpected<JsonError> target_error(JsonErrc code) {
    return std::unexpected(JsonError{code, 0, {}});
}

JsonResult<std::size_t> materialize_into(const LazyValue &value, Target &target) {
    auto chosen = target.choose(value);
    if (!chosen) {
        return locate(std::move(chosen.error()), value);
    }
    Target &dest = *chosen ? **chosen : target;

    JsonResult<WalkEnd> end;
    switch (value.kind()) {
    case LazyKind::Object:
        end = walk_object(value, [&](const RawString &key, const LazyValue &child) -> JsonResult<WalkStep> {
            MaybeOwnedString name = key.view();
            auto sub = dest.field(name.view());
            if (!sub) {
                return locate(std::move(sub.error()), child);
            }
            if (*sub == nullptr) {
                return WalkStep::skip();
            }
            auto child_end = materialize_into(child, **sub);
            if (!child_end) {
                return std::unexpected(std::move(child_end.error()));
            }
            return WalkStep::consumed(*child_end);
        });
        break;
    case LazyKind::Array:
        end = walk_array(value, [&](std::size_t index, const LazyValue &child) -> JsonResult<WalkStep> {
            auto sub = dest.element(index);
            if (!sub) {
                return locate(std::move(sub.error()), child);
            }
            if (*sub == nullptr) {
                return WalkStep::skip();
            }
            auto child_end = materialize_into(child, **sub);
            if (!child_end) {
                return std::unexpected(std::move(child_end.error()));
            }
            return WalkStep::consumed(*child_end);
        });
        break;
    case LazyKind::String:
    case LazyKind::Number:
    case LazyKind::True:
    case LazyKind::False:
    case LazyKind::Null: {
        Value scalar;
        auto scalar_end = materialize(value, scalar);
        if (!scalar_end) {
            return std::unexpected(std::move(scalar_end.error()));
        }
        auto lifted = dest.lift(std::move(scalar));
        if (!lifted) {
            return locate(std::move(lifted.error()), value);
        }
        return *scalar_end;
    }
    }
    if (!end) {
        return std::unexpected(std::move(end.error()));
    }
    auto built = dest.construct();
    if (!built) {
        return locate(std::move(built.error()), value);
    }
    return end->pos;
}

JsonResult<Target *> ValueTarget::choose(const LazyValue &value) {
    kind_ = value.kind();
    children_.clear();
    return this;
}

JsonResult<Target *> ValueTarget::field(std::string_view key) {
    children_.emplace_back(std::string(key), std::make_unique<ValueTarget>());
    return children_.back().second.get();
}

JsonResult<Target *> ValueTarget::element(std::size_t) {
    children_.emplace_back(std::string(), std::make_unique<ValueTarget>());
    return children_.back().second.get();
}

JsonResult<void> ValueTarget::lift(Value &&value) {
    value_ = std::move(value);
    return {};
}

JsonResult<void> ValueTarget::construct() {
    if (kind_ == LazyKind::Object) {
        value_ = Value::make_object();
        Object &object = value_.as_object();
        for (auto &[key, child] : children_) {
            object.set(std::move(key), std::move(child->value()));
        }
    } else {
        value_ = Value::make_array(children_.size());
        Array &array = value_.as_array();
        for (auto &child : children_) {
            array.push_back(std::move(child.second->value()));
        }
    }
    children_.clear();
    return {};
}

} // namespace lazyjson::json
