#include <QCoreApplication>
#include <QDebug>

#include "src/index_ring_test.h"
#include "src/bounded_queue_test.h"
#include "src/channel_test.h"
#include "src/queue_bench.h"


int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    int failed = 0;

    qDebug() << "\n" << "index_ring test";
    failed += run_tst_index_ring_paranoid(argc, argv);

    qDebug() << "\n" << "bounded_queue test";
    failed += run_tst_bounded_queue_paranoid(argc, argv);

    qDebug() << "\n" << "channel test";
    failed += run_tst_channel_api_paranoid(argc, argv);

    if (qEnvironmentVariableIntValue("MPMC_BENCH") == 1) {
        run_queue_bench();
    }

    if (failed != 0) {
        qWarning() << "failed test functions:" << failed;
    }
    return (failed == 0) ? 0 : 1;
}
