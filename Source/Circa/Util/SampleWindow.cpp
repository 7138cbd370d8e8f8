#include "SampleWindow.hpp"
#include "JsonUtil.hpp"
#include "../Core/ConVar.hpp"
#include "../Core/Log.hpp"
#include <cmath>
#include <istream>
#include <ostream>
#include <stdio.h>
#include <stdlib.h>

namespace circa
{
    ConVar snapshotJson{"snapshotJson", "1", "Print the sample window as a JSON array instead of plain values."};

    bool SampleWindow::parseSample(const std::string& token, float& sample)
    {
        char* end = nullptr;
        float parsed = strtof(token.c_str(), &end);
        if (end == token.c_str() || *end != '\0')
            return false;

        if (!std::isfinite(parsed))
            return false;

        sample = parsed;
        return true;
    }

    bool SampleWindow::addToken(const std::string& token)
    {
        float sample;
        if (!parseSample(token, sample))
        {
            logWarn(CircaLogCategorySampler, "Skipping non-numeric sample \"%s\"", token.c_str());
            return false;
        }

        addSample(sample);
        return true;
    }

    void SampleWindow::addSample(float sample)
    {
        window.push(sample);
        logVrb(CircaLogCategorySampler, "sample %llu = %.3f", (unsigned long long)window.pushCount(), sample);
    }

    float SampleWindow::newest() const
    {
        const float* last = window.last();
        return last ? *last : 0.0f;
    }

    float SampleWindow::peak() const
    {
        if (window.pushCount() == 0)
            return 0.0f;

        size_t filled = window.pushCount() < SAMPLE_WINDOW_SIZE ? (size_t)window.pushCount() : SAMPLE_WINDOW_SIZE;
        std::array<float, SAMPLE_WINDOW_SIZE> ordered = window.toArray();

        // Unfilled slots sit at the front and must not count towards the peak.
        size_t first = SAMPLE_WINDOW_SIZE - filled;
        float highest = ordered[first];
        for (size_t i = first + 1; i < SAMPLE_WINDOW_SIZE; i++)
        {
            if (ordered[i] > highest)
                highest = ordered[i];
        }
        return highest;
    }

    std::string SampleWindow::formatWindow(bool asJson) const
    {
        if (asJson)
        {
            nlohmann::json j = window;
            return j.dump();
        }

        std::string formatted;
        char buf[32];
        for (float sample : window.toArray())
        {
            snprintf(buf, sizeof(buf), "%.3f", sample);
            if (!formatted.empty())
                formatted += ' ';
            formatted += buf;
        }
        return formatted;
    }

    std::string SampleWindow::formatReport() const
    {
        char buf[128];
        snprintf(buf, sizeof(buf), "samples: %llu\nnewest: %.3f\npeak: %.3f\n",
                 (unsigned long long)sampleCount(), newest(), peak());

        std::string report = buf;
        report += "window: ";
        report += formatWindow(snapshotJson.getInt() != 0);
        report += '\n';
        return report;
    }

    int runSampler(std::istream& in, std::ostream& out)
    {
        SampleWindow window;
        std::string token;

        while (in >> token)
        {
            window.addToken(token);
        }

        if (window.sampleCount() == 0)
        {
            logErr(CircaLogCategorySampler, "No samples read");
            return 1;
        }

        out << window.formatReport();
        return 0;
    }
}
