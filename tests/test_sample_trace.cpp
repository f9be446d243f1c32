#include "core/input/SampleTrace.hpp"
#include <cassert>
#include <cmath>
#include <fstream>

int main() {
    st::SampleTrace trace;
    assert(!trace.loadCSV("missing-trace.csv"));

    std::ofstream out("trace_test.csv");
    out << "# x,y,z,t\n";
    out << "0.5,1,-0.5,0.0\n";
    out << "\n";
    out << "not,a,sample,row\n";
    out << "1,2,3\n";
    out << "0.75, 1.25, -0.25, 0.016\r\n";
    out << "1,2,3,4,5\n";
    out.close();

    assert(trace.loadCSV("trace_test.csv"));
    assert(trace.size() == 2);
    assert(trace.samples()[0].position == st::Vector3(0.5f, 1.f, -0.5f));
    assert(trace.samples()[1].position == st::Vector3(0.75f, 1.25f, -0.25f));
    assert(std::fabs(trace.samples()[1].timestamp - 0.016) < 1e-12);

    trace.addSample(2.f, 2.f, 2.f, 0.032);
    assert(trace.exportCSV("trace_export.csv"));

    st::SampleTrace reloaded;
    assert(reloaded.loadCSV("trace_export.csv"));
    assert(reloaded.size() == 3);
    assert(reloaded.samples()[2].position == st::Vector3(2.f, 2.f, 2.f));
    assert(std::fabs(reloaded.samples()[2].timestamp - 0.032) < 1e-12);
    assert(reloaded.positions().size() == 3);

    reloaded.clear();
    assert(reloaded.empty());
    return 0;
}
