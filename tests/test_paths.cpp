#include "test_common.h"
#include "apkbridge/paths.h"
#include "apkbridge/types.h"

using namespace apkbridge;
namespace fs = std::filesystem;

static ErrorKind resolve_kind(const fs::path& root, const std::string& rel) {
    try {
        (void)resolve_inside(root, rel);
    } catch (const ToolError& e) {
        return e.kind();
    }
    die("expected resolve_inside to throw for " + rel);
    return ErrorKind::IoError;
}

int main() {
    const fs::path dir = make_temp_dir("paths");
    const fs::path root = fs::canonical(dir) / "proj";
    write_text(root / "res" / "values" / "strings.xml", "<resources/>");

    // Test 1: canonical_path
    {
        expect_eq_str(canonical_path((root / "res" / ".." / "res/").string()), (root / "res").string(), "dot-dot and slash");
        expect_eq_str(canonical_path((root / "not" / "yet").string()), (root / "not" / "yet").string(),
                      "missing tail kept");
        fs::create_symlink(root, dir / "alias");
        expect_eq_str(canonical_path((dir / "alias" / "res").string()), (root / "res").string(), "symlink resolved");
    }

    // Test 2: resolve_inside accepts paths inside the root, existing or not
    {
        expect_eq_str(resolve_inside(root, "res/values/strings.xml").string(),
                      (root / "res/values/strings.xml").string(), "existing file");
        expect_eq_str(resolve_inside(root, "res/new/file.xml").string(), (root / "res/new/file.xml").string(),
                      "missing file");
        expect_eq_str(resolve_inside(root, "res/../apktool.yml").string(), (root / "apktool.yml").string(),
                      "inner dot-dot");
    }

    // Test 3: escapes
    {
        expect_true(resolve_kind(root, "../outside") == ErrorKind::PathTraversal, "parent escape");
        expect_true(resolve_kind(root, "res/../../outside") == ErrorKind::PathTraversal, "nested escape");
        expect_true(resolve_kind(root, "/etc/passwd") == ErrorKind::PathTraversal, "absolute path");
        expect_true(resolve_kind(root, "") == ErrorKind::InvalidArguments, "empty path");

        fs::create_symlink("/tmp", root / "tmplink");
        expect_true(resolve_kind(root, "tmplink/x") == ErrorKind::PathTraversal, "symlinked dir escape");

        // a sibling sharing the prefix is still outside
        fs::create_directories(dir / "proj2");
        expect_true(resolve_kind(root, "../proj2/x") == ErrorKind::PathTraversal, "prefix sibling");
    }

    // Test 4: helpers
    {
        expect_true(is_path_under(root / "res", root), "child under root");
        expect_true(is_path_under(root, root), "root under itself");
        expect_true(!is_path_under(dir / "proj2", root), "sibling not under root");
        expect_eq_str(relative_generic(root / "res" / "values", root), "res/values", "relative path");
    }

    fs::remove_all(dir);
    std::cerr << "test_paths: ALL PASSED" << std::endl;
    return 0;
}
