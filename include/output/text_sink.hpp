#ifndef TEXT_SINK_HPP
#define TEXT_SINK_HPP

#include <ostream>
#include <string>

// Destination for recognized text. Implementations append one trailing space
// so the text stays separated from whatever follows the cursor.
class TextOutputSink {
public:
    virtual ~TextOutputSink() = default;

    virtual void emit(const std::string& text) = 0;
};

class ConsoleTextSink : public TextOutputSink {
public:
    explicit ConsoleTextSink(std::ostream& out) : out_(out) {}

    void emit(const std::string& text) override;

private:
    std::ostream& out_;
};

#endif
