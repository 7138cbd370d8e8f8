#pragma once
#include <iosfwd>
#include <stdint.h>
#include <string>
#include "CircularArray.hpp"

namespace circa
{
    const size_t SAMPLE_WINDOW_SIZE = 128;

    // Rolling history of the last SAMPLE_WINDOW_SIZE numeric samples.
    class SampleWindow
    {
      public:
        // Accepts finite numbers only. "nan" and "inf" are rejected.
        static bool parseSample(const std::string& token, float& sample);

        // Pushes the token if it parses, otherwise logs a warning and skips it.
        bool addToken(const std::string& token);
        void addSample(float sample);

        uint64_t sampleCount() const
        {
            return window.pushCount();
        }

        // Both return 0 before the first sample.
        float newest() const;
        float peak() const;

        std::string formatWindow(bool asJson) const;

        // Uses the snapshotJson convar to pick the window format.
        std::string formatReport() const;

        const CircularArray<float, SAMPLE_WINDOW_SIZE>& samples() const
        {
            return window;
        }

      private:
        CircularArray<float, SAMPLE_WINDOW_SIZE> window;
    };

    // Reads whitespace separated samples until end of input and writes the report.
    // Returns the process exit code: 1 when no sample could be read.
    int runSampler(std::istream& in, std::ostream& out);
}
