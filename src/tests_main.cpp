#include <QCoreApplication>
#include <QDebug>

#include "slot_test.h"
#include "critical_section_test.h"
#include "static_cell_test.h"


int main(int argc, char** argv)
{
    QCoreApplication app(argc, argv);

    int status = 0;

    qDebug() << "\n" << "optional_slot test";
    status |= run_tst_optional_slot_api_paranoid(argc, argv);

    qDebug() << "\n" << "critical_section test";
    status |= run_tst_critical_section_api_paranoid(argc, argv);

    qDebug() << "\n" << "static_cell test";
    status |= run_tst_static_cell_api_paranoid(argc, argv);

    return status;
}
