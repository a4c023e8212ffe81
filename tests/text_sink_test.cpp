#include "output/text_sink.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

TEST(ConsoleTextSinkTest, AppendsTrailingSpace) {
    std::ostringstream out;
    ConsoleTextSink sink(out);

    sink.emit("hello");

    EXPECT_EQ(out.str().rfind("hello ", 0), 0u);
}

TEST(ConsoleTextSinkTest, ConsecutiveTextStaysSeparated) {
    std::ostringstream out;
    ConsoleTextSink sink(out);

    sink.emit("one");
    sink.emit("two");

    EXPECT_EQ(out.str(), "one \ntwo \n");
}
