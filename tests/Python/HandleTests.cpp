// HandleTests.cpp - reference-count semantics of Owned / Borrowed handles

#include <catch2/catch_test_macros.hpp>

#include "TestSupport.hpp"

#include <utility>

using namespace NGIN::Python;
using TestSupport::Gil;
using TestSupport::Unwrap;

TEST_CASE("OwnedReleasesExactlyOneReference", "[python][Handle]")
{
  const auto gil = Gil();
  auto list = OwnedOrFetch(gil, PyList_New(0));
  REQUIRE(list.has_value());
  const auto base = (*list)->RefCount();

  {
    auto extra = list->Clone(gil);
    CHECK((*list)->RefCount() == base + 1);
    CHECK(extra->Is(**list));
  }
  CHECK((*list)->RefCount() == base);
}

TEST_CASE("BorrowedNeverReleases", "[python][Handle]")
{
  const auto gil = Gil();
  auto list = OwnedOrFetch(gil, PyList_New(0));
  REQUIRE(list.has_value());
  const auto base = (*list)->RefCount();

  {
    auto view = list->Borrow();
    auto again = view;
    CHECK(again.Get() == list->Get());
  }
  CHECK((*list)->RefCount() == base);
}

TEST_CASE("ClaimOwnershipTakesANewUnit", "[python][Handle]")
{
  const auto gil = Gil();
  auto list = OwnedOrFetch(gil, PyList_New(0));
  REQUIRE(list.has_value());
  const auto base = (*list)->RefCount();

  auto claimed = list->Borrow().ClaimOwnership();
  CHECK((*list)->RefCount() == base + 1);
  claimed = Owned<Object>::FromOwnedPtr(gil, nullptr);
  CHECK((*list)->RefCount() == base);
}

TEST_CASE("MovedFromOwnedIsEmpty", "[python][Handle]")
{
  const auto gil = Gil();
  auto list = OwnedOrFetch(gil, PyList_New(0));
  REQUIRE(list.has_value());
  const auto base = (*list)->RefCount();

  Owned<Object> moved = std::move(*list);
  CHECK_FALSE(list->IsValid());
  CHECK(moved.IsValid());
  CHECK(moved->RefCount() == base);
}

TEST_CASE("IntoPtrHandsTheReferenceToTheCaller", "[python][Handle]")
{
  const auto gil = Gil();
  auto list = OwnedOrFetch(gil, PyList_New(0));
  REQUIRE(list.has_value());
  const auto base = (*list)->RefCount();

  PyObject *raw = std::move(*list).IntoPtr();
  CHECK_FALSE(list->IsValid());
  CHECK(Py_REFCNT(raw) == base);
  Py_DECREF(raw);
}

TEST_CASE("DowncastChecksTheGuestType", "[python][Handle]")
{
  const auto gil = Gil();
  auto text = Str::New(gil, "hello");
  REQUIRE(text.has_value());
  auto asObject = text->Borrow().Upcast<Object>();

  auto asStr = Downcast<Str>(gil, asObject);
  REQUIRE(asStr.has_value());
  CHECK(Unwrap((*asStr)->ToUtf8(gil)) == "hello");

  auto asTuple = Downcast<Tuple>(gil, asObject);
  REQUIRE_FALSE(asTuple.has_value());
  CHECK(asTuple.error().Code() == ErrorCode::TypeError);
  CHECK(asTuple.error().Message() == "expected tuple, got str");
}

TEST_CASE("TupleAndDictViews", "[python][Handle]")
{
  const auto gil = Gil();
  auto one = IntoPython<int>::Convert(gil, 1);
  auto two = IntoPython<int>::Convert(gil, 2);
  REQUIRE(one.has_value());
  REQUIRE(two.has_value());

  auto tuple = Tuple::New(gil, {one->Borrow(), two->Borrow()});
  REQUIRE(tuple.has_value());
  CHECK((*tuple)->Size() == 2);
  CHECK((*tuple)->GetItem(gil, 1).Get() == two->Get());
  auto tail = (*tuple)->Slice(gil, 1, 2);
  REQUIRE(tail.has_value());
  CHECK((*tail)->Size() == 1);

  auto dict = Dict::New(gil);
  REQUIRE(dict.has_value());
  REQUIRE((*dict)->SetItem(gil, "one", one->Borrow()).has_value());
  REQUIRE((*dict)->SetItem(gil, "two", two->Borrow()).has_value());
  CHECK((*dict)->Size() == 2);

  auto found = (*dict)->GetItem(gil, "two");
  REQUIRE(found.has_value());
  REQUIRE(found->has_value());
  CHECK((*found)->Get() == two->Get());

  auto missing = (*dict)->GetItem(gil, "three");
  REQUIRE(missing.has_value());
  CHECK_FALSE(missing->has_value());

  int entries = 0;
  (*dict)->ForEach(gil, [&](Borrowed<Object>, Borrowed<Object>) { ++entries; });
  CHECK(entries == 2);
}

TEST_CASE("ObjectAttributesAndCalls", "[python][Handle]")
{
  const auto gil = Gil();
  auto module = Module::Import(gil, "math");
  REQUIRE(module.has_value());

  auto pi = (*module)->GetAttr(gil, "pi");
  REQUIRE(pi.has_value());
  CHECK(Unwrap(FromPython<double>::Extract(gil, pi->Borrow())) > 3.14);

  CHECK(Unwrap((*module)->HasAttr(gil, "sqrt")));
  CHECK_FALSE(Unwrap((*module)->HasAttr(gil, "no_such_function")));

  auto missing = (*module)->GetAttr(gil, "no_such_function");
  REQUIRE_FALSE(missing.has_value());
  CHECK(missing.error().Matches(gil, PyExc_AttributeError));

  auto sqrt = (*module)->GetAttr(gil, "sqrt");
  REQUIRE(sqrt.has_value());
  auto sixteen = IntoPython<double>::Convert(gil, 16.0);
  REQUIRE(sixteen.has_value());
  auto args = Tuple::New(gil, {sixteen->Borrow()});
  REQUIRE(args.has_value());
  auto four = (*sqrt)->Call(gil, args->Borrow());
  REQUIRE(four.has_value());
  CHECK(Unwrap(FromPython<double>::Extract(gil, four->Borrow())) == 4.0);

  CHECK(Unwrap((*sixteen)->Repr(gil)) == "16.0");
  CHECK((*sixteen)->TypeName() == "float");
  CHECK(None(gil)->IsNone());
}
