#include "change.hpp"
#include <cctype>
#include <utility>
#include <glog/logging.h>

Change Change::insertion(int pos, std::string text) {
  Change c{Insertion};
  c.pos = pos;
  c.text = std::move(text);
  return c;
}

Change Change::mergeable_insertion(int pos, char ch) {
  Change c{MergeableInsertion};
  c.pos = pos;
  c.text.assign(1, ch);
  return c;
}

Change Change::deletion(int pos, std::string deleted) {
  Change c{Deletion};
  c.pos = pos;
  c.text = std::move(deleted);
  return c;
}

Change Change::transposition(int pos) {
  Change c{Transposition};
  c.pos = pos;
  return c;
}

Change Change::uppercase(int pos, std::string original) {
  Change c{Uppercase};
  c.pos = pos;
  c.text = std::move(original);
  return c;
}

Change Change::composite(const Memento& before, Change inner, const Memento& after) {
  Change c{Composite};
  c.before = before;
  c.after = after;
  c.inner = std::make_unique<Change>(std::move(inner));
  return c;
}

static char upper(char ch) {
  return static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
}

void Change::undo(EditBuffer& ed) const {
  switch (type) {
    case Insertion:
    case MergeableInsertion:
      ed.delete_range(pos, static_cast<int>(text.size()));
      break;
    case Deletion:
      ed.insert(pos, text);
      break;
    case Transposition:
      ed.transpose(pos);
      break;
    case Uppercase:
      for (size_t i = 0; i < text.size(); ++i) ed.set_char(pos + static_cast<int>(i), text[i]);
      break;
    case Composite:
      inner->undo(ed);
      before.restore(ed);
      break;
  }
}

void Change::redo(EditBuffer& ed) const {
  switch (type) {
    case Insertion:
    case MergeableInsertion:
      ed.insert(pos, text);
      break;
    case Deletion:
      ed.delete_range(pos, static_cast<int>(text.size()));
      break;
    case Transposition:
      ed.transpose(pos);
      break;
    case Uppercase:
      for (size_t i = 0; i < text.size(); ++i) ed.set_char(pos + static_cast<int>(i), upper(text[i]));
      break;
    case Composite:
      inner->redo(ed);
      after.restore(ed);
      break;
  }
}

bool Change::amalgamate(const Change& other) {
  switch (type) {
    case MergeableInsertion:
      if (other.type != MergeableInsertion || other.text.size() != 1) return false;
      // a typing run never continues past the end of a line
      if (!text.empty() && text.back() == '\n') return false;
      if (other.pos != pos + static_cast<int>(text.size())) return false;
      text += other.text;
      return true;
    case Composite:
      CHECK(other.type == Composite)
          << "cannot amalgamate a composite change with a " << change_type_name(other.type) << " change";
      if (!inner->amalgamate(*other.inner)) return false;
      after = other.after;
      return true;
    default:
      return false;
  }
}

const char* change_type_name(Change::Type t) {
  switch (t) {
    case Change::Insertion: return "insertion";
    case Change::MergeableInsertion: return "mergeable-insertion";
    case Change::Deletion: return "deletion";
    case Change::Transposition: return "transposition";
    case Change::Uppercase: return "uppercase";
    case Change::Composite: return "composite";
  }
  return "?";
}
