#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <dreamer/memory.hpp>
#include <dreamer/stack.hpp>
#include <dreamer/state.hpp>

#include <nlohmann/json.hpp>

#include <limits>
#include <stdexcept>
#include <vector>

using namespace dreamer;

TEST_CASE( "stack", "[stack]" ) {
  stack stk;

  SECTION( "starts empty" ) {
    REQUIRE(stk.empty());
    REQUIRE(stk.depth() == 0);
    REQUIRE_FALSE(stk.pop().has_value());
    REQUIRE_FALSE(stk.peek().has_value());
  }

  SECTION( "last in first out" ) {
    REQUIRE(stk.push(1));
    REQUIRE(stk.push(2));
    REQUIRE(stk.push(3));

    REQUIRE(stk.depth() == 3);
    REQUIRE(*stk.peek() == 3);
    REQUIRE(*stk.pop() == 3);
    REQUIRE(*stk.pop() == 2);
    REQUIRE(*stk.pop() == 1);
    REQUIRE(stk.empty());
  }

  SECTION( "elements are listed bottom to top" ) {
    stk.push(10);
    stk.push(20);

    REQUIRE((stk.elements() == std::vector<word>{ 10, 20 }));
  }

  SECTION( "bounded at 65535 elements" ) {
    for(std::size_t i = 0; i < stack::max_depth; ++i)
      REQUIRE(stk.push(i));

    REQUIRE(stk.full());
    REQUIRE(stk.depth() == 65535);
    REQUIRE_FALSE(stk.push(0));
    REQUIRE(stk.depth() == 65535);
    REQUIRE(*stk.peek() == 65534);
  }

  SECTION( "json bigger than the bound is rejected" ) {
    nlohmann::json j = std::vector<word>(stack::max_depth, 1);
    REQUIRE(j.get<stack>().depth() == stack::max_depth);

    j.push_back(1);
    REQUIRE_THROWS_AS(j.get<stack>(), std::length_error);
  }
}

TEST_CASE( "memory", "[memory]" ) {
  memory mem;

  SECTION( "unwritten cells read as zero" ) {
    REQUIRE(mem.read(0) == 0);
    REQUIRE(mem.read(12345) == 0);
    REQUIRE(mem.read(std::numeric_limits<word>::max()) == 0);

    // reading does not create cells
    REQUIRE(mem.size() == 0);
  }

  SECTION( "writes stick and overwrite" ) {
    mem.write(7, 70);
    mem.write(std::numeric_limits<word>::max(), 1);

    REQUIRE(mem.read(7) == 70);
    REQUIRE(mem.read(std::numeric_limits<word>::max()) == 1);
    REQUIRE(mem.size() == 2);

    mem.write(7, 0);
    REQUIRE(mem.read(7) == 0);
    REQUIRE(mem.size() == 2);
  }

  SECTION( "sorted by address" ) {
    mem.write(30, 3);
    mem.write(10, 1);
    mem.write(20, 2);

    auto cells = mem.sorted();
    REQUIRE(cells.size() == 3);
    REQUIRE(cells[0].first == 10);
    REQUIRE(cells[1].first == 20);
    REQUIRE(cells[2].first == 30);
  }

  SECTION( "copies are independent" ) {
    mem.write(1, 1);
    memory copy = mem;
    copy.write(1, 2);

    REQUIRE(mem.read(1) == 1);
    REQUIRE(copy.read(1) == 2);
    REQUIRE(mem != copy);
  }
}

TEST_CASE( "state presentation", "[state]" ) {
  state st;

  SECTION( "default state" ) {
    REQUIRE(st.program_counter() == 0);
    REQUIRE(st.reg == 0);
    REQUIRE(st.stack.empty());
    REQUIRE(st.memory.size() == 0);
    REQUIRE(st.to_string() == "pc: 0, reg: 0, stack: [], memory: {}");
  }

  SECTION( "text" ) {
    st.pc = 4;
    st.reg = 9;
    st.stack.push(1);
    st.stack.push(2);
    st.memory.write(5, 50);
    st.memory.write(1, 10);

    REQUIRE(st.to_string() == "pc: 4, reg: 9, stack: [1, 2], memory: {1: 10, 5: 50}");
  }

  SECTION( "json" ) {
    st.pc = 2;
    st.stack.push(8);
    st.memory.write(3, 4);

    nlohmann::json j = st;
    REQUIRE(j.dump() == R"({"memory":[[3,4]],"pc":2,"reg":0,"stack":[8]})");

    auto back = j.get<state>();
    REQUIRE(back == st);
  }
}
