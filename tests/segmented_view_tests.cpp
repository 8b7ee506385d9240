#include <functional>
#include <iostream>
#include <string>
#include <vector>

#include "common/errors.hpp"
#include "common/segmented_view.hpp"
#include "common/subject.hpp"

using tus::Answer;
using tus::SegmentedView;
using tus::Subject;

namespace {

struct TestRunner {
  int failures{0};

  void expect(bool condition, const std::string& msg) {
    if (!condition) {
      ++failures;
      std::cerr << "[FAIL] " << msg << "\n";
    }
  }

  template <typename E>
  void expect_throws(const std::function<void()>& fn, const std::string& msg) {
    try {
      fn();
    } catch (const E&) {
      return;
    } catch (const std::exception& ex) {
      ++failures;
      std::cerr << "[FAIL] " << msg << " (wrong exception: " << ex.what() << ")\n";
      return;
    }
    ++failures;
    std::cerr << "[FAIL] " << msg << " (no exception)\n";
  }

  int exit_code() const {
    if (failures == 0) {
      std::cout << "[PASS] all segmented view tests\n";
      return 0;
    }
    std::cerr << "[FAILURES] total: " << failures << "\n";
    return 1;
  }
};

// A(3) B(0) C(2) D(4): nine slots, with an empty segment in the middle.
std::vector<Subject> make_subjects() {
  std::vector<Subject> subjects;
  subjects.emplace_back("A", 3);
  subjects.emplace_back("B", 0);
  subjects.emplace_back("C", 2);
  subjects.emplace_back("D", 4);
  return subjects;
}

const Subject* by_name(const std::vector<Subject>& subjects, const std::string& name) {
  for (const auto& s : subjects) {
    if (s.name() == name) return &s;
  }
  return nullptr;
}

Answer pattern(std::size_t i) {
  switch (i % 3) {
    case 0:
      return Answer::Correct;
    case 1:
      return Answer::Wrong;
    default:
      return Answer::Empty;
  }
}

}  // namespace

int main() {
  TestRunner tr;

  // Subject counters and net score.
  {
    Subject s("Anatomi", 10);
    for (std::size_t i = 0; i < 4; ++i) s.set(i, Answer::Correct);
    for (std::size_t i = 4; i < 8; ++i) s.set(i, Answer::Wrong);
    for (std::size_t i = 8; i < 10; ++i) s.set(i, Answer::Empty);
    tr.expect(s.num_correct() == 4, "subject correct count");
    tr.expect(s.num_wrong() == 4, "subject wrong count");
    tr.expect(s.num_empty() == 2, "subject empty count");
    tr.expect(s.num_net() == 3.0, "net is correct - wrong / 4");
    tr.expect(s.size() == 10, "subject size fixed");
  }

  {
    Subject s("Fizyoloji", 5);
    s.set(0, Answer::Wrong);
    tr.expect(s.num_net() == -0.25, "single wrong answer gives -0.25");
    tr.expect(s.get(1) == Answer::Missing, "fresh slots are missing");
    tr.expect_throws<tus::IndexOutOfRange>([&] { s.get(5); }, "subject get past end throws");
    tr.expect_throws<tus::IndexOutOfRange>([&] { s.set(7, Answer::Correct); },
                                           "subject set past end throws");
  }

  // Total length and index translation.
  {
    auto subjects = make_subjects();
    SegmentedView view(subjects);
    tr.expect(view.size() == 9, "total length is the sum of segments");
    tr.expect(view.cursor() == 0, "cursor starts at zero");

    auto first = view.locate(0);
    tr.expect(first && first->subject == "A" && first->index == 0, "index 0 maps to A[0]");
    auto after_empty = view.locate(3);
    tr.expect(after_empty && after_empty->subject == "C" && after_empty->index == 0,
              "index 3 skips the empty segment");
    auto last = view.locate(8);
    tr.expect(last && last->subject == "D" && last->index == 3, "index 8 maps to D[3]");
    tr.expect(!view.locate(9), "locate past end is empty");
    tr.expect(!view.locate(1000), "locate far past end is empty");
  }

  // locate agrees with get for every index.
  {
    auto subjects = make_subjects();
    SegmentedView view(subjects);
    for (std::size_t i = 0; i < view.size(); ++i) view.set(i, pattern(i));
    for (std::size_t i = 0; i < view.size(); ++i) {
      auto loc = view.locate(i);
      tr.expect(loc.has_value(), "locate valid index " + std::to_string(i));
      if (!loc) continue;
      const Subject* s = by_name(subjects, loc->subject);
      tr.expect(s != nullptr && s->get(loc->index) == view.get(i),
                "locate/get agree at " + std::to_string(i));
    }
  }

  // set touches exactly one slot, in the underlying subject.
  {
    auto subjects = make_subjects();
    SegmentedView view(subjects);
    view.set(4, Answer::Wrong);
    tr.expect(view.get(4) == Answer::Wrong, "set/get round-trip");
    tr.expect(subjects[2].get(1) == Answer::Wrong, "write lands in C[1]");
    bool others_missing = true;
    for (std::size_t i = 0; i < view.size(); ++i) {
      if (i != 4 && view.get(i) != Answer::Missing) others_missing = false;
    }
    tr.expect(others_missing, "no other slot changed");

    tr.expect_throws<tus::IndexOutOfRange>([&] { view.get(9); }, "get past end throws");
    tr.expect_throws<tus::IndexOutOfRange>([&] { view.set(9, Answer::Correct); },
                                           "set past end throws");
  }

  // Sequential fill until full, then exhaustion.
  {
    auto subjects = make_subjects();
    SegmentedView view(subjects);
    for (std::size_t i = 0; i + 1 < view.size(); ++i) {
      tr.expect(!view.update_next(Answer::Correct), "not full before last slot");
      tr.expect(view.cursor() == i + 1, "cursor advances by one");
    }
    tr.expect(view.update_next(Answer::Empty), "last slot reports full");
    tr.expect(view.full(), "view is full");
    tr.expect(subjects[3].get(3) == Answer::Empty, "last slot written to D[3]");
    tr.expect_throws<tus::CursorExhausted>([&] { view.update_next(Answer::Correct); },
                                           "update past full throws");
    tr.expect(view.cursor() == view.size(), "cursor stays at length after exhaustion");
  }

  // update then erase restores the cursor and resets the slot.
  {
    auto subjects = make_subjects();
    SegmentedView view(subjects);
    view.update_next(Answer::Correct);
    view.update_next(Answer::Correct);
    std::size_t c = view.cursor();
    view.update_next(Answer::Wrong);
    tr.expect(view.erase_last(), "erase after update succeeds");
    tr.expect(view.cursor() == c, "cursor back where it was");
    tr.expect(view.get(c) == Answer::Missing, "erased slot is missing again");
    tr.expect(view.get(c - 1) == Answer::Correct, "earlier slot untouched");
  }

  // Erase at cursor 0 is a no-op.
  {
    auto subjects = make_subjects();
    SegmentedView view(subjects);
    view.set(5, Answer::Correct);
    tr.expect(!view.erase_last(), "erase at zero returns false");
    tr.expect(view.cursor() == 0, "cursor unchanged");
    tr.expect(view.get(5) == Answer::Correct, "content unchanged");
  }

  // Erase all the way back from full.
  {
    auto subjects = make_subjects();
    SegmentedView view(subjects);
    while (!view.full()) view.update_next(Answer::Wrong);
    std::size_t erased = 0;
    while (view.erase_last()) ++erased;
    tr.expect(erased == view.size(), "every slot erasable once");
    tr.expect(view.cursor() == 0, "cursor back at zero");
    for (const auto& s : subjects) {
      tr.expect(s.num_wrong() == 0, "subject " + s.name() + " cleared");
    }
  }

  return tr.exit_code();
}
