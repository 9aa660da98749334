#include "test_common.h"
#include "apkbridge/json_util.h"
#include "apkbridge/registry.h"
#include "apkbridge/tools.h"

#include <set>

using namespace apkbridge;

static ToolDesc make_desc(const std::string& name) {
    ToolDesc d;
    d.name = name;
    d.handler = [](ToolContext&) { return std::string("{}"); };
    return d;
}

// Runs validate and returns the error (or nullopt when args are accepted).
static std::optional<ToolError> try_validate(const ToolRegistry& reg, const ToolDesc& d, const std::string& args) {
    json_util::Doc doc = json_util::parse(args);
    if (!doc) die("test args are not JSON: " + args);
    try {
        reg.validate(d, doc.root);
    } catch (const ToolError& e) {
        return e;
    }
    return std::nullopt;
}

static std::set<std::string> field_names(const ToolError& e) {
    std::set<std::string> out;
    json_util::Doc det = json_util::parse(e.details_json());
    json_object* fields = json_util::get(det.root, "fields");
    if (!fields) return out;
    for (size_t i = 0; i < json_object_array_length(fields); i++) {
        out.insert(json_util::get_string(json_object_array_get_idx(fields, i), "name").value_or(""));
    }
    return out;
}

int main() {
    // Test 1: register + resolve
    {
        ToolRegistry reg;
        reg.register_tool(make_desc("alpha"));
        expect_eq_str(reg.resolve("alpha").name, "alpha", "resolve");
        try {
            reg.resolve("beta");
            die("unknown tool should throw");
        } catch (const ToolError& e) {
            expect_true(e.kind() == ErrorKind::ToolNotFound, "ToolNotFound");
        }
    }

    // Test 2: duplicate names are rejected
    {
        ToolRegistry reg;
        reg.register_tool(make_desc("alpha"));
        try {
            reg.register_tool(make_desc("alpha"));
            die("duplicate should throw");
        } catch (const ToolError& e) {
            expect_true(e.kind() == ErrorKind::DuplicateTool, "DuplicateTool");
        }
        expect_eq_ll((long long)reg.size(), 1, "registry unchanged after duplicate");
    }

    // Test 3: frozen registry refuses registration
    {
        ToolRegistry reg;
        reg.register_tool(make_desc("alpha"));
        reg.freeze();
        try {
            reg.register_tool(make_desc("beta"));
            die("frozen registry should refuse");
        } catch (const ToolError& e) {
            expect_true(e.kind() == ErrorKind::InvalidPrecondition, "frozen -> InvalidPrecondition");
        }
        expect_true(reg.resolve("alpha").handler != nullptr, "lookups still work when frozen");
    }

    // Test 4: validate reports every offending field at once
    {
        ToolRegistry reg;
        ToolDesc d = make_desc("typed");
        ParamSpec p1; p1.name = "path"; p1.type = ParamType::Path; p1.required = true;
        ParamSpec p2; p2.name = "flag"; p2.type = ParamType::Boolean;
        ParamSpec p3; p3.name = "count"; p3.type = ParamType::Integer; p3.min_int = 1;
        ParamSpec p4; p4.name = "mode"; p4.type = ParamType::Enum; p4.enum_values = {"fast", "slow"};
        ParamSpec p5; p5.name = "exts"; p5.type = ParamType::StringList;
        d.params = {p1, p2, p3, p4, p5};
        reg.register_tool(d);

        expect_true(!try_validate(reg, d, "{\"path\":\"/x\"}"), "minimal args accepted");
        expect_true(!try_validate(reg, d, "{\"path\":\"/x\",\"flag\":true,\"count\":3,\"mode\":\"slow\",\"exts\":[\".xml\"]}"),
                    "full args accepted");
        expect_true(!try_validate(reg, d, "{\"path\":\"/x\",\"flag\":null}"), "null is treated as absent");

        auto err = try_validate(reg, d,
            "{\"flag\":\"yes\",\"count\":0,\"mode\":\"medium\",\"exts\":[1],\"bogus\":1}");
        expect_true(err.has_value(), "bad args rejected");
        expect_true(err->kind() == ErrorKind::InvalidArguments, "InvalidArguments");
        auto names = field_names(*err);
        for (const char* n : {"path", "flag", "count", "mode", "exts", "bogus"}) {
            expect_true(names.count(n) == 1, std::string("field reported: ") + n);
        }

        auto empty_path = try_validate(reg, d, "{\"path\":\"\"}");
        expect_true(empty_path && field_names(*empty_path).count("path"), "empty path rejected");

        try {
            json_util::Doc arr = json_util::parse("[1,2]");
            reg.validate(d, arr.root);
            die("array arguments should be rejected");
        } catch (const ToolError& e) {
            expect_true(e.kind() == ErrorKind::InvalidArguments, "non-object arguments");
        }
    }

    // Test 5: no-argument tools accept null and {}
    {
        ToolRegistry reg;
        ToolDesc d = make_desc("noargs");
        reg.register_tool(d);
        reg.validate(d, nullptr);
        expect_true(!try_validate(reg, d, "{}"), "{} accepted");
        expect_true(try_validate(reg, d, "{\"x\":1}").has_value(), "unknown arg rejected");
    }

    // Test 6: built-in tool set
    {
        ToolRegistry reg;
        register_builtin_tools(reg);
        reg.freeze();
        const std::vector<std::string> want = {
            "build_apk", "check_apktool_version", "clean_project", "decode_apk", "delete_project",
            "list_resources", "list_workspaces", "read_file", "search_in_files", "workspace_status", "write_file",
        };
        auto all = reg.all();
        expect_eq_ll((long long)all.size(), (long long)want.size(), "builtin count");
        for (size_t i = 0; i < want.size(); i++) {
            expect_eq_str(all[i]->name, want[i], "builtin order");
        }

        const ToolDesc& dec = reg.resolve("decode_apk");
        expect_true(dec.lock == LockMode::Exclusive && dec.effect == StateEffect::Decode, "decode descriptor");
        expect_true(dec.timeout_class == TimeoutClass::Heavy, "decode is heavy");
        expect_true(bool(dec.prepare), "decode checks its output dir before Decoding");
        const ToolDesc& del = reg.resolve("delete_project");
        expect_true(del.lock == LockMode::Exclusive && del.effect == StateEffect::Reset, "delete descriptor");
        expect_true(reg.resolve("read_file").lock == LockMode::Shared, "read_file shared");
        expect_true(reg.resolve("workspace_status").lock == LockMode::None, "status takes no lease");

        json_util::Doc j = json_util::parse(tool_desc_to_json(dec));
        expect_true(bool(j), "descriptor JSON parses");
        expect_eq_str(json_util::get_string(j.root, "lock").value_or(""), "exclusive", "descriptor lock");

        ToolRegistry again;
        register_builtin_tools(again);
        try {
            register_builtin_tools(again);
            die("registering builtins twice should fail");
        } catch (const ToolError& e) {
            expect_true(e.kind() == ErrorKind::DuplicateTool, "second registration -> DuplicateTool");
        }
    }

    std::cerr << "test_registry: ALL PASSED" << std::endl;
    return 0;
}
