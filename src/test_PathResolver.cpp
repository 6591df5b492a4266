#undef NDEBUG
#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>
#include <vector>
#include <sys/stat.h>

#include "PathResolver.h"
#include "TestUtils.h"

namespace {

bool contains(const std::vector<std::string>& v, const fs::path& p)
{
    return std::find(v.begin(), v.end(), p.string()) != v.end();
}

void test_recursive_walk_with_excludes()
{
    TempDir dir;
    fs::path root = dir.path / "monitored";
    fs::path a = WriteFile(root / "a.txt", "a");
    fs::path b = WriteFile(root / "sub" / "b.txt", "b");
    fs::path skipped = WriteFile(root / "sub" / "skip.txt", "s");
    fs::path hidden = WriteFile(root / "excluded" / "deep" / "c.txt", "c");

    // 같은 파일을 두 번 include 해도 한 번만 나온다
    PathResolver resolver({ root.string(), a.string() },
                          { (root / "excluded").string(), skipped.string() });
    ResolveResult result = resolver.Resolve();

    assert(result.warnings.empty());
    assert(result.files.size() == 2);
    assert(result.files[0] == a.string());
    assert(result.files[1] == b.string());
    assert(!contains(result.files, skipped));
    assert(!contains(result.files, hidden));
    assert(std::is_sorted(result.files.begin(), result.files.end()));
}

// exclude는 include보다 우선한다
void test_exclude_precedence()
{
    TempDir dir;
    fs::path file = WriteFile(dir.path / "data" / "file.txt", "x");

    PathResolver resolver({ file.string() }, { (dir.path / "data").string() });
    assert(resolver.Resolve().files.empty());
}

// "/a/data"는 "/a/database.txt"를 제외하지 않는다
void test_component_wise_matching()
{
    TempDir dir;
    fs::path kept = WriteFile(dir.path / "database.txt", "kept");
    fs::path dropped = WriteFile(dir.path / "data" / "x.txt", "dropped");

    PathResolver resolver({ dir.path.string() }, { (dir.path / "data").string() + "/" });
    ResolveResult result = resolver.Resolve();

    assert(contains(result.files, kept));
    assert(!contains(result.files, dropped));

    assert(PathResolver::IsDescendantOrEqual("/etc/ssh/sshd_config", "/etc/ssh"));
    assert(PathResolver::IsDescendantOrEqual("/etc/ssh", "/etc/ssh"));
    assert(!PathResolver::IsDescendantOrEqual("/etc/sshd", "/etc/ssh"));
    assert(!PathResolver::IsDescendantOrEqual("/etc", "/etc/ssh"));
    assert(PathResolver::IsDescendantOrEqual("/anything", "/"));
}

void test_missing_include_is_warning()
{
    TempDir dir;
    fs::path present = WriteFile(dir.path / "present.txt", "p");

    PathResolver resolver({ (dir.path / "nope").string(), present.string() }, {});
    ResolveResult result = resolver.Resolve();

    assert(result.warnings.size() == 1);
    assert(result.files.size() == 1);
    assert(result.files[0] == present.string());
}

void test_empty_include()
{
    PathResolver resolver({}, { "/tmp" });
    ResolveResult result = resolver.Resolve();
    assert(result.files.empty());
    assert(result.warnings.empty());
}

// 파일 링크는 링크 경로로 포함, 디렉토리 링크는 따라가지 않음
void test_symlink_policy()
{
    TempDir dir;
    fs::path root = dir.path / "root";
    fs::path outside = dir.path / "outside";
    fs::path target = WriteFile(outside / "target.txt", "t");
    WriteFile(outside / "nested" / "escape.txt", "e");
    fs::path local = WriteFile(root / "local.txt", "l");

    fs::create_symlink(target, root / "file_link");
    fs::create_directory_symlink(outside, root / "dir_link");
    fs::create_symlink(dir.path / "dangling", root / "broken_link");

    PathResolver resolver({ root.string() }, {});
    ResolveResult result = resolver.Resolve();

    assert(result.files.size() == 2);
    assert(contains(result.files, root / "file_link"));
    assert(contains(result.files, local));
    for (const auto& f : result.files)
    {
        assert(f.find("dir_link") == std::string::npos);
        assert(f.find("escape.txt") == std::string::npos);
    }
}

void test_special_files_skipped()
{
    TempDir dir;
    fs::path regular = WriteFile(dir.path / "r.txt", "r");
    assert(mkfifo((dir.path / "fifo").c_str(), 0600) == 0);

    PathResolver resolver({ dir.path.string() }, {});
    ResolveResult result = resolver.Resolve();
    assert(result.files.size() == 1);
    assert(result.files[0] == regular.string());
}

void test_normalize()
{
    fs::path cwd = fs::current_path();
    assert(PathResolver::Normalize("a/../b/") == cwd / "b");
    assert(PathResolver::Normalize("/etc//ssh/./") == fs::path("/etc/ssh"));
    assert(PathResolver::Normalize("/") == fs::path("/"));
}

} // namespace

int main()
{
    test_recursive_walk_with_excludes();
    test_exclude_precedence();
    test_component_wise_matching();
    test_missing_include_is_warning();
    test_empty_include();
    test_symlink_policy();
    test_special_files_skipped();
    test_normalize();

    std::cout << "test_PathResolver: all tests passed" << std::endl;
    return 0;
}
