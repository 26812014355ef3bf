#include "JSONWriter.h"
#include "GoalCatalog.h"
#include "JsonUtil.h"
#include "BuildInfo.h"
#include <map>
#include <sstream>

namespace revkit {
namespace {

    struct CanonVal {
        enum Type { T_OBJ, T_ARR, T_STR, T_NUM } type = T_OBJ;
        std::map<std::string, CanonVal> obj;
        std::vector<CanonVal> arr;
        std::string str; // string & number token text
        CanonVal() = default;
        explicit CanonVal(Type t): type(t) {}
    };

    static void canon_emit(const CanonVal& v, std::ostream& os, bool pretty, int depth);

    static void newline(std::ostream& os, bool pretty, int depth) {
        if(!pretty) return;
        os << '\n';
        for(int i = 0; i < depth; ++i) os << "  ";
    }

    static void emit_array(const CanonVal& v, std::ostream& os, bool pretty, int depth) {
        if(v.arr.empty()) { os << "[]"; return; }
        os << '[';
        bool first = true;
        for(const auto& e : v.arr) {
            if(!first) os << ',';
            first = false;
            newline(os, pretty, depth + 1);
            canon_emit(e, os, pretty, depth + 1);
        }
        newline(os, pretty, depth);
        os << ']';
    }

    static void emit_object(const CanonVal& v, std::ostream& os, bool pretty, int depth) {
        if(v.obj.empty()) { os << "{}"; return; }
        os << '{';
        bool first = true;
        for(const auto& kv : v.obj) {
            if(!first) os << ',';
            first = false;
            newline(os, pretty, depth + 1);
            os << '"' << jsonutil::escape(kv.first) << '"' << (pretty ? ": " : ":");
            canon_emit(kv.second, os, pretty, depth + 1);
        }
        newline(os, pretty, depth);
        os << '}';
    }

    static void canon_emit(const CanonVal& v, std::ostream& os, bool pretty, int depth) {
        switch(v.type) {
            case CanonVal::T_STR: os << '"' << jsonutil::escape(v.str) << '"'; break;
            case CanonVal::T_NUM: os << v.str; break;
            case CanonVal::T_ARR: emit_array(v, os, pretty, depth); break;
            case CanonVal::T_OBJ: emit_object(v, os, pretty, depth); break;
        }
    }

    static void put_str(CanonVal& o, const std::string& k, const std::string& v) {
        o.obj[k].type = CanonVal::T_STR;
        o.obj[k].str = v;
    }

    static void put_num(CanonVal& o, const std::string& k, long long v) {
        o.obj[k].type = CanonVal::T_NUM;
        o.obj[k].str = std::to_string(v);
    }

    static CanonVal str_val(const std::string& s) {
        CanonVal v{CanonVal::T_STR};
        v.str = s;
        return v;
    }

    static CanonVal str_array(const std::vector<std::string>& items) {
        CanonVal a{CanonVal::T_ARR};
        for(const auto& s : items) a.arr.push_back(str_val(s));
        return a;
    }

    static CanonVal build_meta_object(const std::string& kind) {
        CanonVal meta{CanonVal::T_OBJ};
        put_str(meta, "json_schema_version", "1");
        put_str(meta, "kind", kind);
        put_str(meta, "tool_version", buildinfo::APP_VERSION);
        return meta;
    }

    static CanonVal build_module_object(const Module& m) {
        CanonVal o{CanonVal::T_OBJ};
        put_str(o, "id", m.id);
        put_str(o, "title", m.title);
        put_str(o, "category", category_to_string(m.category));
        put_num(o, "token_estimate", m.token_estimate);
        o.obj["dependencies"] = str_array(m.dependencies);
        o.obj["tags"] = str_array(std::vector<std::string>(m.tags.begin(), m.tags.end()));
        if(m.checklist_items) put_num(o, "checklist_items", *m.checklist_items);
        return o;
    }

    static std::string render(const CanonVal& root, bool pretty) {
        std::ostringstream os;
        canon_emit(root, os, pretty, 0);
        os << '\n';
        return os.str();
    }
}

std::string JSONWriter::write(const ExecutionPlan& plan) const {
    CanonVal root{CanonVal::T_OBJ};
    root.obj["meta"] = build_meta_object("plan");
    root.obj["ordered_modules"] = str_array(plan.ordered_ids());
    put_num(root, "total_tokens", plan.total_tokens);
    put_num(root, "module_count", static_cast<long long>(plan.ordered_modules.size()));
    root.obj["dropped_modules"] = str_array(plan.dropped_modules);
    root.obj["warnings"] = str_array(plan.warnings);
    return render(root, pretty_);
}

std::string JSONWriter::write(const CompositionManifest& manifest) const {
    CanonVal root{CanonVal::T_OBJ};
    root.obj["meta"] = build_meta_object("composition");
    CanonVal entries{CanonVal::T_ARR};
    for(const auto& e : manifest.entries) {
        CanonVal o{CanonVal::T_OBJ};
        put_str(o, "id", e.id);
        put_num(o, "declared_tokens", e.declared_tokens);
        put_num(o, "measured_tokens", e.measured_tokens);
        put_num(o, "offset", static_cast<long long>(e.offset));
        put_num(o, "length", static_cast<long long>(e.length));
        entries.arr.push_back(std::move(o));
    }
    root.obj["modules"] = std::move(entries);
    put_num(root, "declared_tokens", manifest.declared_tokens);
    put_num(root, "measured_tokens", manifest.measured_tokens);
    put_num(root, "artifact_bytes", static_cast<long long>(manifest.artifact_bytes));
    put_str(root, "sha256", manifest.sha256);
    root.obj["warnings"] = str_array(manifest.warnings);
    return render(root, pretty_);
}

std::string JSONWriter::write(const ScoreReport& report) const {
    CanonVal root{CanonVal::T_OBJ};
    root.obj["meta"] = build_meta_object("score");
    put_str(root, "session", report.session_name);
    put_str(root, "risk_level", risk_level_to_string(report.risk_level));
    put_num(root, "total_findings", static_cast<long long>(report.total_findings));

    CanonVal sev{CanonVal::T_OBJ};
    for(const auto& kv : report.counts_by_severity) put_num(sev, severity_to_string(kv.first), static_cast<long long>(kv.second));
    root.obj["counts_by_severity"] = std::move(sev);

    if(report.checklist_percentage) {
        CanonVal cl{CanonVal::T_OBJ};
        cl.obj["percentage"].type = CanonVal::T_NUM;
        cl.obj["percentage"].str = jsonutil::format_decimal(*report.checklist_percentage);
        put_num(cl, "items_total", report.checklist_items_total);
        put_num(cl, "items_failing", report.checklist_items_failing);
        root.obj["checklist"] = std::move(cl);
    }

    CanonVal by_mod{CanonVal::T_OBJ};
    for(const auto& kv : report.findings_by_module) put_num(by_mod, kv.first, static_cast<long long>(kv.second));
    root.obj["findings_by_module"] = std::move(by_mod);
    CanonVal by_cat{CanonVal::T_OBJ};
    for(const auto& kv : report.findings_by_category) put_num(by_cat, kv.first, static_cast<long long>(kv.second));
    root.obj["findings_by_category"] = std::move(by_cat);
    return render(root, pretty_);
}

std::string JSONWriter::write_modules(const std::vector<const Module*>& modules) const {
    CanonVal root{CanonVal::T_OBJ};
    root.obj["meta"] = build_meta_object("modules");
    CanonVal arr{CanonVal::T_ARR};
    long long total = 0;
    for(const auto* m : modules) {
        arr.arr.push_back(build_module_object(*m));
        total += m->token_estimate;
    }
    root.obj["modules"] = std::move(arr);
    put_num(root, "module_count", static_cast<long long>(modules.size()));
    put_num(root, "total_tokens", total);
    return render(root, pretty_);
}

std::string JSONWriter::write_goals(const GoalCatalog& goals) const {
    CanonVal root{CanonVal::T_OBJ};
    root.obj["meta"] = build_meta_object("goals");
    CanonVal arr{CanonVal::T_ARR};
    for(const auto& g : goals.goals()) {
        CanonVal o{CanonVal::T_OBJ};
        put_str(o, "name", g.name);
        put_str(o, "title", g.title);
        o.obj["modules"] = str_array(g.module_ids);
        o.obj["tags"] = str_array(g.tags);
        arr.arr.push_back(std::move(o));
    }
    root.obj["goals"] = std::move(arr);
    return render(root, pretty_);
}

}
