#include <sstream>
#include <string>

#include "test_utils.hh"
#include "treeprep/audit_log.hh"
#include "treeprep/prune.hh"

using treeprep::act_t;

namespace {

void build_empty_tree(const test::tmp_tree_t &tree) {
  tree.write("empty.txt", "");
  tree.write("keep.txt", "x");
  tree.write("only_empty/e.txt", "");
  tree.write("nested/inner/e2", "");
  tree.write("mixed/e3", "");
  tree.write("mixed/full", "data");
  tree.mkdir("already_empty");
}

}  // namespace

int main() {
  test::runner_t runner("prune");

  // --- empty items ---
  {
    test::tmp_tree_t tree("empty");
    build_empty_tree(tree);
    std::ostringstream out;
    treeprep::audit_log_t log(out);

    auto removed = treeprep::prune_empty(tree.src(), true, log, act_t::apply);
    runner.expect_eq(removed, 7UL, "files and emptied dirs removed");
    runner.expect(!tree.has("empty.txt"), "zero-byte file removed");
    runner.expect(tree.has("keep.txt"), "non-empty file kept");
    runner.expect(!tree.has("only_empty"), "dir of empty files removed");
    runner.expect(!tree.has("nested"), "emptied chain removed");
    runner.expect(tree.has("already_empty"), "dir empty beforehand kept");
    runner.expect(tree.has("mixed/full") && !tree.has("mixed/e3"),
                  "mixed dir kept");
    runner.expect(std::filesystem::exists(tree.src()), "root kept");
    runner.expect_eq(test::count_verb(test::lines_of(out.str()), "EmptyRemoved"),
                     7UL, "EmptyRemoved records");
  }
  {
    test::tmp_tree_t tree("empty_keep_dirs");
    build_empty_tree(tree);
    std::ostringstream out;
    treeprep::audit_log_t log(out);

    auto removed = treeprep::prune_empty(tree.src(), false, log, act_t::apply);
    runner.expect_eq(removed, 4UL, "only files removed");
    runner.expect(tree.has("only_empty") && tree.has("already_empty"),
                  "dirs kept when not pruning dirs");
  }
  {
    test::tmp_tree_t tree("empty_dry");
    build_empty_tree(tree);
    std::ostringstream out;
    treeprep::audit_log_t log(out);

    auto removed = treeprep::prune_empty(tree.src(), true, log, act_t::log);
    runner.expect_eq(removed, 7UL, "dry run sees emptied dirs");
    runner.expect(tree.has("empty.txt") && tree.has("nested/inner/e2"),
                  "dry run removes nothing");
  }

  // --- duplicate archives ---
  {
    test::tmp_tree_t tree("archives");
    tree.write("report.zip", "zipdata");
    tree.write("report/page.txt", "page");
    tree.write("lonely.zip", "only copy");
    tree.write("data.tar.gz", "tgz");
    tree.write("data", "expanded");
    tree.write("Photos.ZIP", "zip");
    tree.mkdir("Photos");
    tree.write(".zip", "odd");
    std::ostringstream out;
    treeprep::audit_log_t log(out);

    auto removed = treeprep::prune_archives(
        tree.src(), treeprep::default_archive_suffixes(), log, act_t::apply);
    runner.expect_eq(removed, 3UL, "redundant archives removed");
    runner.expect(!tree.has("report.zip"), "archive next to folder removed");
    runner.expect(tree.has("report/page.txt"), "expanded folder untouched");
    runner.expect(tree.has("lonely.zip"), "only copy kept");
    runner.expect(!tree.has("data.tar.gz") && tree.has("data"),
                  "longest suffix stripped");
    runner.expect(!tree.has("Photos.ZIP"), "suffix matched case-insensitively");
    runner.expect(tree.has(".zip"), "bare suffix is not an archive");

    auto lines = test::lines_of(out.str());
    runner.expect_eq(test::count_verb(lines, "ArchiveRemoved"), 3UL,
                     "ArchiveRemoved records");
    const auto expanded = (tree.src() / "report").native();
    bool found = false;
    for (const auto &line : lines) {
      found |= line.size() >= expanded.size() &&
               line.compare(line.size() - expanded.size(), expanded.size(),
                            expanded) == 0;
    }
    runner.expect(found, "expanded path recorded as detail");
  }

  // --- rules ---
  {
    auto rule = treeprep::unsupported_rule();
    runner.expect(rule.matches("a.TMP"), "extension case-insensitive");
    runner.expect(rule.matches("~$report.docx"), "lock file prefix");
    runner.expect(rule.matches("Thumbs.db"), "exact name");
    runner.expect(!rule.matches("notes.tmp.txt"), "extension must end the name");
    runner.expect(!rule.matches("report.docx"), "allowed type");
    runner.expect(!rule.matches("xthumbs.db"), "exact name only");

    auto vendor = treeprep::vendor_rule({"XYZ"});
    runner.expect(vendor.matches("Company.QBW"), "vendor company file");
    runner.expect(vendor.matches("Company.qbw.tlg"), "vendor transaction log");
    runner.expect(vendor.matches("f.xyz"), "extra extension without dot");
    runner.expect(!vendor.matches("report.pdf"), "not a vendor file");
    runner.expect(vendor.action() == treeprep::action_t::vendor_removed,
                  "vendor verb");
  }
  {
    test::tmp_tree_t tree("rules");
    tree.write("a.TMP", "t");
    tree.write("sub/~$doc.docx", "lock");
    tree.write("sub/doc.docx", "doc");
    tree.write("books/Company.QBW", "qb");
    tree.write("books/Company.qbw.tlg", "log");
    tree.write("books/report.pdf", "pdf");
    std::ostringstream out;
    treeprep::audit_log_t log(out);

    auto unsupported = treeprep::prune_by_rule(
        tree.src(), treeprep::unsupported_rule(), log, act_t::apply);
    auto vendor = treeprep::prune_by_rule(tree.src(), treeprep::vendor_rule(),
                                          log, act_t::apply);
    runner.expect_eq(unsupported, 2UL, "unsupported removed");
    runner.expect_eq(vendor, 2UL, "vendor removed");
    runner.expect(tree.has("sub/doc.docx") && tree.has("books/report.pdf"),
                  "allowed files kept");
    auto lines = test::lines_of(out.str());
    runner.expect_eq(test::count_verb(lines, "UnsupportedRemoved"), 2UL,
                     "UnsupportedRemoved records");
    runner.expect_eq(test::count_verb(lines, "VendorRemoved"), 2UL,
                     "VendorRemoved records");
  }

  return runner.finish();
}
