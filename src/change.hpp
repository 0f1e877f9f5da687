#pragma once
/*
 * Change
 *
 * Purpose: one reversible step of edit history.
 * Design: closed set of kinds behind a type tag; undo/redo/amalgamate
 *         switch on the tag. Composite owns the change it wraps.
 */
#include <memory>
#include <string>
#include "edit_buffer.hpp"

struct Change {
  enum Type { Insertion, MergeableInsertion, Deletion, Transposition, Uppercase, Composite } type;
  int pos = 0;
  // Inserted text, deleted text, or the original text of an uppercased word.
  std::string text;
  Memento before;
  Memento after;
  std::unique_ptr<Change> inner;

  static Change insertion(int pos, std::string text);
  static Change mergeable_insertion(int pos, char ch);
  static Change deletion(int pos, std::string deleted);
  static Change transposition(int pos);
  static Change uppercase(int pos, std::string original);
  static Change composite(const Memento& before, Change inner, const Memento& after);

  // Reset the buffer to its state before the change.
  void undo(EditBuffer& ed) const;
  // Reset the buffer to its state after the change.
  void redo(EditBuffer& ed) const;
  // Try to absorb a later change into this one. Returns false, with no
  // effect, when the two cannot be merged.
  bool amalgamate(const Change& other);
};

const char* change_type_name(Change::Type t);
