#include <iostream>
#include <string>

#include "context.h"
#include "error.h"
#include "events.h"
#include "shared_engine.h"

int main(int argc, char** argv) {
    std::string text = argc > 1 ? argv[1] : "Hello world.";
    try {
        auto ctx = speak::Context();
        ctx.synthesizeText(text);
        std::cout << ctx.samples().size() << " samples at "
                  << speak::sampleRate() << " Hz" << std::endl;
        for (auto const& e : ctx.events()) {
            std::cout << speak::toString(e.type()) << " text=" << e.textPosition
                      << " audio=" << e.audioPosition.count() << "ms";
            if (e.type() == speak::SynthEventType::Word) {
                std::cout << " number=" << e.number()
                          << " length=" << e.length();
            }
            std::cout << std::endl;
        }
    } catch (speak::Error const& e) {
        std::cerr << e.what() << " (" << std::hex << e.code << ")"
                  << std::endl;
        return 1;
    }
}
