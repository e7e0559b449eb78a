#include <sstream>
#include <string>

#include "test_utils.hh"
#include "treeprep/audit_log.hh"
#include "treeprep/name_sanitizer.hh"

using treeprep::act_t;

int main() {
  test::runner_t runner("name_sanitizer");

  // --- sanitize_name ---
  runner.expect_eq(treeprep::sanitize_name("my:file?.docx"),
                   std::string("my_file_.docx"), "colon and question mark");
  runner.expect_eq(treeprep::sanitize_name("*:\"<>?|/\\"),
                   std::string("_________"), "every reserved character");
  runner.expect_eq(treeprep::sanitize_name("r\xC3\xA9sum\xC3\xA9*.txt"),
                   std::string("r\xC3\xA9sum\xC3\xA9_.txt"),
                   "multibyte characters preserved");
  runner.expect_eq(treeprep::sanitize_name("plain name (1).pdf"),
                   std::string("plain name (1).pdf"), "clean name unchanged");
  runner.expect(treeprep::has_reserved("a|b"), "has_reserved");
  runner.expect(!treeprep::has_reserved("a-b"), "has_reserved clean");

  // --- renames, nested ---
  {
    test::tmp_tree_t tree("names");
    tree.write("my:file?.docx", "doc");
    tree.write("a|b/c<d>.txt", "nested");
    tree.write("back\\slash.txt", "bs");
    std::ostringstream out;
    treeprep::audit_log_t log(out);

    auto renamed = treeprep::sanitize_names(tree.src(), log, act_t::apply);
    runner.expect_eq(renamed, 4UL, "renamed count");
    runner.expect(tree.has("my_file_.docx"), "file renamed");
    runner.expect(!tree.has("my:file?.docx"), "old name gone");
    runner.expect(tree.has("a_b/c_d_.txt"), "child and parent renamed");
    runner.expect(tree.has("back_slash.txt"), "backslash replaced");

    auto lines = test::lines_of(out.str());
    runner.expect_eq(test::count_verb(lines, "Renamed"), 4UL, "Renamed records");
    // child recorded before its parent
    runner.expect(lines.size() >= 2 && lines[0].find("c<d>.txt") != std::string::npos,
                  "deepest entry first");

    // nothing left to do
    auto again = treeprep::sanitize_names(tree.src(), log, act_t::apply);
    runner.expect_eq(again, 0UL, "second run renames nothing");
  }

  // --- collision ---
  {
    test::tmp_tree_t tree("collide");
    tree.write("x?.txt", "one");
    tree.write("x_.txt", "two");
    std::ostringstream out;
    treeprep::audit_log_t log(out);

    auto renamed = treeprep::sanitize_names(tree.src(), log, act_t::apply);
    runner.expect_eq(renamed, 0UL, "collision not renamed");
    runner.expect(tree.has("x?.txt") && tree.has("x_.txt"), "both kept");
    auto lines = test::lines_of(out.str());
    runner.expect_eq(test::count_verb(lines, "NameCollision"), 1UL,
                     "NameCollision recorded");
    runner.expect_eq(log.failures(), 1UL, "collision counted as failure");
  }

  // --- dry run ---
  {
    test::tmp_tree_t tree("names_dry");
    tree.write("q?.txt", "q");
    std::ostringstream out;
    treeprep::audit_log_t log(out);

    auto renamed = treeprep::sanitize_names(tree.src(), log, act_t::log);
    runner.expect_eq(renamed, 1UL, "dry run reports rename");
    runner.expect(tree.has("q?.txt"), "dry run keeps name");
  }

  // --- siblings sanitizing to one name, dry run agrees with apply ---
  {
    test::tmp_tree_t tree("names_siblings");
    tree.write("a:b.txt", "colon");
    tree.write("a?b.txt", "question");
    std::ostringstream dry_out;
    treeprep::audit_log_t dry_log(dry_out);
    auto dry = treeprep::sanitize_names(tree.src(), dry_log, act_t::log);

    std::ostringstream out;
    treeprep::audit_log_t log(out);
    auto renamed = treeprep::sanitize_names(tree.src(), log, act_t::apply);

    runner.expect_eq(dry, 1UL, "dry run renames one sibling");
    runner.expect_eq(renamed, 1UL, "apply renames one sibling");
    runner.expect_eq(test::count_verb(test::lines_of(dry_out.str()), "NameCollision"),
                     1UL, "dry run reports the sibling collision");
    runner.expect(dry_out.str() == out.str(), "dry run log matches apply log");
    runner.expect(tree.has("a_b.txt") && tree.has("a?b.txt"), "second sibling kept");
  }

  return runner.finish();
}
