////////////////////////////////////////////////////////////////////////////////
// Timer.hh
////////////////////////////////////////////////////////////////////////////////
/*! @file
//      A dynamic collection of named, nestable timing sections.
//      A section S2 started while S1 is still running is reported as S1:S2
//      (indented one level below S1).
*/
////////////////////////////////////////////////////////////////////////////////
#ifndef TIMER_HH
#define TIMER_HH
#include <map>
#include <iostream>
#include <string>
#include <vector>

#include <sys/time.h>

// Get time in seconds
inline double Time(void) {
    struct timeval t;
    gettimeofday(&t, NULL);
    return t.tv_sec + t.tv_usec/1.0e6;
}

class Timer
{
private:
    struct _Section {
        bool running = false;
        double startTime = 0, time = 0;
        int invocations = 0;

        // gets elapsed time (even if currently running)
        double elapsed() const { return running ? time + (Time() - startTime) : time; }
        void start() {
            if (running) {
                std::cerr << "ERROR: timer already running. Reported timings will be inaccurate." << std::endl;
                stop();
            }
            running = true; ++invocations; startTime = Time();
        }
        void stop() {
            if (!running) return;
            time += Time() - startTime; running = false;
        }
    };

    typedef std::map<std::string, _Section> SectionMap;
    SectionMap               m_sections;
    std::vector<std::string> m_sectionStack;
    double                   m_startTime;

    static std::string displayName(const std::string &name) {
        size_t levels = 0;
        for (char c : name)
            if (c == ':') ++levels;
        if (levels == 0) return name;

        std::string result(4 * levels, ' ');
        result.append(name, name.rfind(':') + 1, std::string::npos);
        return result;
    }

public:
    Timer() { reset(); }

    void startSection(const std::string &name) {
        std::string fullName = m_sectionStack.empty() ? name : m_sectionStack.back() + ':' + name;
        m_sectionStack.push_back(fullName);
        m_sections[fullName].start();
    }

    void stopSection(const std::string &name) {
        if (m_sectionStack.empty()) {
            std::cerr << "ERROR: no timer section is running (asked to stop "
                      << name << ")" << std::endl;
            return;
        }
        std::string currentName = m_sectionStack.back();
        m_sectionStack.pop_back();

        std::string fullName = m_sectionStack.empty() ? name : m_sectionStack.back() + ':' + name;
        if (fullName != currentName) {
            std::cerr << "ERROR: sections must be stopped in the reverse of "
                         "the order they were started." << std::endl;
            std::cerr << "(Expected " << currentName << ", but got " << fullName
                      << ")" << std::endl;
        }
        m_sections[currentName].stop();
    }

    // Remove all sections and restart the global clock.
    void reset() {
        m_sections.clear();
        m_sectionStack.clear();
        m_startTime = Time();
    }

    double sectionTime(const std::string &fullName) const {
        auto it = m_sections.find(fullName);
        return (it == m_sections.end()) ? 0.0 : it->second.elapsed();
    }

    void report(std::ostream &os) const {
        for (const auto &entry : m_sections) {
            os << displayName(entry.first) << '\t' << entry.second.elapsed()
               << '\t' << entry.second.invocations << '\n';
        }
        os << "Full time\t" << Time() - m_startTime << '\n';
    }
};

#endif // TIMER_HH
