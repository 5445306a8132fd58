#pragma once

namespace etabar {
namespace render {

class WidthProvider {
public:
    virtual ~WidthProvider() = default;
    
    // Terminal column count, or 0 when it cannot be determined.
    virtual int columns() const = 0;
};

// Asks the terminal behind `fd` via TIOCGWINSZ, then falls back to the
// COLUMNS environment variable.
class TerminalWidthProvider : public WidthProvider {
public:
    explicit TerminalWidthProvider(int fd);
    TerminalWidthProvider();
    
    int columns() const override;

private:
    int fd_;
    
    int queryTerminal() const;
    static int readColumnsEnv();
};

class FixedWidthProvider : public WidthProvider {
public:
    explicit FixedWidthProvider(int columns) : columns_(columns < 0 ? 0 : columns) {}
    
    int columns() const override { return columns_; }

private:
    int columns_;
};

}}
