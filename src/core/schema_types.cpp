#include "core/schema_types.hpp"
#include "core/utils.hpp"

namespace dbsurvey {

std::string_view sort_direction_to_string(SortDirection d) {
    return d == SortDirection::ASCENDING ? "Ascending" : "Descending";
}

std::string_view referential_action_to_string(ReferentialAction a) {
    switch (a) {
        case ReferentialAction::NO_ACTION: return "NoAction";
        case ReferentialAction::RESTRICT: return "Restrict";
        case ReferentialAction::CASCADE: return "Cascade";
        case ReferentialAction::SET_NULL: return "SetNull";
        case ReferentialAction::SET_DEFAULT: return "SetDefault";
        default: return "NoAction";
    }
}

std::string_view constraint_type_to_string(ConstraintType t) {
    switch (t) {
        case ConstraintType::PRIMARY_KEY: return "PrimaryKey";
        case ConstraintType::FOREIGN_KEY: return "ForeignKey";
        case ConstraintType::UNIQUE: return "Unique";
        case ConstraintType::CHECK: return "Check";
        default: return "Check";
    }
}

std::string_view routine_kind_to_string(RoutineKind k) {
    return k == RoutineKind::FUNCTION ? "Function" : "Procedure";
}

std::string_view parameter_mode_to_string(ParameterMode m) {
    switch (m) {
        case ParameterMode::IN: return "In";
        case ParameterMode::OUT: return "Out";
        case ParameterMode::INOUT: return "InOut";
        default: return "In";
    }
}

std::string_view trigger_timing_to_string(TriggerTiming t) {
    switch (t) {
        case TriggerTiming::BEFORE: return "Before";
        case TriggerTiming::AFTER: return "After";
        case TriggerTiming::INSTEAD_OF: return "InsteadOf";
        default: return "After";
    }
}

std::string_view trigger_event_to_string(TriggerEvent e) {
    switch (e) {
        case TriggerEvent::INSERT: return "Insert";
        case TriggerEvent::UPDATE: return "Update";
        case TriggerEvent::DELETE: return "Delete";
        case TriggerEvent::TRUNCATE: return "Truncate";
        default: return "Insert";
    }
}

std::optional<ReferentialAction> parse_referential_action(std::string_view s) {
    const std::string v = utils::to_lower(s);
    // Single-letter forms are pg_constraint.confdeltype/confupdtype codes
    if (v == "a" || v == "no action") return ReferentialAction::NO_ACTION;
    if (v == "r" || v == "restrict") return ReferentialAction::RESTRICT;
    if (v == "c" || v == "cascade") return ReferentialAction::CASCADE;
    if (v == "n" || v == "set null") return ReferentialAction::SET_NULL;
    if (v == "d" || v == "set default") return ReferentialAction::SET_DEFAULT;
    return std::nullopt;
}

std::optional<TriggerTiming> parse_trigger_timing(std::string_view s) {
    const std::string v = utils::to_lower(s);
    if (v == "before") return TriggerTiming::BEFORE;
    if (v == "after") return TriggerTiming::AFTER;
    if (v == "instead of") return TriggerTiming::INSTEAD_OF;
    return std::nullopt;
}

std::optional<TriggerEvent> parse_trigger_event(std::string_view s) {
    const std::string v = utils::to_lower(s);
    if (v == "insert") return TriggerEvent::INSERT;
    if (v == "update") return TriggerEvent::UPDATE;
    if (v == "delete") return TriggerEvent::DELETE;
    if (v == "truncate") return TriggerEvent::TRUNCATE;
    return std::nullopt;
}

} // namespace dbsurvey
